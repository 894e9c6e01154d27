//
// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

#ifndef METRICSQL_PLANNER_PLAN_BUILDER_H_
#define METRICSQL_PLANNER_PLAN_BUILDER_H_

#include <string>
#include <utility>

#include "absl/status/statusor.h"
#include "metricsql/planner/plan_tree.h"
#include "metricsql/public/dialect.h"
#include "metricsql/public/metrics_view.h"
#include "metricsql/public/query.h"
#include "metricsql/public/security_policy.h"

namespace metricsql {

// Calendar conventions for time grains, resolved from the query, the metrics
// view and the compiler options.
struct CalendarSettings {
  std::string time_zone = "UTC";
  int first_day_of_week = 1;
  int first_month_of_year = 1;
};

// Builds the plan tree of a validated query whose time ranges are absolute.
//
// The root block is always aliased "base". Measures that cannot be computed
// in one aggregation are computed in child blocks keyed by the same
// dimensions:
//
//  - derived measures: "base" selects from "base_inner", which aggregates
//    the measures they reference;
//  - period comparisons: "base" selects from "base_current" joined to
//    "base_comparison", each aggregating one time range (with its own
//    "_inner" block when derived measures are involved).
//
// A PlanBuilder is immutable and may be shared by concurrent compilations of
// the same view and dialect.
class PlanBuilder {
 public:
  // `view` and `dialect` must outlive the builder. `security_policy` may be
  // null for unrestricted access.
  PlanBuilder(const MetricsView* view, const SecurityPolicy* security_policy,
              const Dialect* dialect, CalendarSettings calendar)
      : view_(view),
        security_policy_(security_policy),
        dialect_(dialect),
        calendar_(std::move(calendar)) {}
  PlanBuilder(const PlanBuilder&) = delete;
  PlanBuilder& operator=(const PlanBuilder&) = delete;

  // Returns an UNSUPPORTED_FEATURE error for pivots, for comparisons grouped
  // by a time grain, and for grains the dialect has no syntax for. Names that
  // do not resolve are COMPILE_INVARIANT errors, as validation rejects them.
  absl::StatusOr<PlanTree> Build(const Query& query) const;

  const MetricsView& view() const { return *view_; }
  const Dialect& dialect() const { return *dialect_; }

 private:
  const MetricsView* view_;
  const SecurityPolicy* security_policy_;
  const Dialect* dialect_;
  const CalendarSettings calendar_;
};

}  // namespace metricsql

#endif  // METRICSQL_PLANNER_PLAN_BUILDER_H_
