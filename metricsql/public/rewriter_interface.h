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

#ifndef METRICSQL_PUBLIC_REWRITER_INTERFACE_H_
#define METRICSQL_PUBLIC_REWRITER_INTERFACE_H_

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "metricsql/planner/plan_tree.h"
#include "metricsql/public/compiler_options.h"
#include "metricsql/public/dialect.h"
#include "metricsql/public/executor.h"
#include "metricsql/public/metrics_view.h"
#include "metricsql/public/query.h"

namespace metricsql {

// Everything a rewrite pass may read. Owned by the compilation; all pointers
// outlive the pipeline run. `executor` may be null, in which case passes that
// need it fail.
struct RewriteContext {
  const MetricsView* view = nullptr;
  const Dialect* dialect = nullptr;
  const CompilerOptions* options = nullptr;
  const ExecutionContext* execution_context = nullptr;
  QueryExecutor* executor = nullptr;

  // The anchor of relative time ranges.
  absl::Time now;
  // Calendar used for time ranges, resolved from the query, the view and the
  // options.
  absl::TimeZone time_zone;
  int first_day_of_week = 1;
  int first_month_of_year = 1;
};

// Facts passes record about the compilation, returned to the caller with
// the SQL.
struct RewriteOutputProperties {
  // The row cap in effect; 0 when none. Results with more rows than this
  // were truncated.
  int64_t row_cap = 0;
};

// A Rewriter transforms the Query before the plan is built, or the PlanTree
// after. Rewriters are registered once per process in the RewriteRegistry
// and run in registration order.
//
// A rewriter must tolerate inputs it does not apply to and leave them
// unchanged; running it twice must give the result of running it once.
//
// Errors follow the same conventions as the rest of the compiler:
// kInvalidArgument and kOutOfRange for inputs the pass cannot handle,
// kUnimplemented for shapes it does not support, kInternal for broken
// invariants. The pipeline tags every error with the pass that produced it.
//
// Thread safety: all Rewriter subclasses must be logically stateless and
// thread-safe.
class Rewriter {
 public:
  enum Stage {
    // Runs on the validated Query.
    QUERY,
    // Runs on the PlanTree built from the rewritten Query.
    PLAN,
  };

  virtual ~Rewriter() {}

  virtual Stage stage() const = 0;

  // Only the method of the rewriter's stage is called.
  virtual absl::Status RewriteQuery(const RewriteContext& context,
                                    Query* query,
                                    RewriteOutputProperties& properties) const {
    return absl::UnimplementedError(
        absl::StrCat(Name(), " does not rewrite queries"));
  }
  virtual absl::Status RewritePlan(const RewriteContext& context,
                                   PlanTree* tree,
                                   RewriteOutputProperties& properties) const {
    return absl::UnimplementedError(
        absl::StrCat(Name(), " does not rewrite plans"));
  }

  virtual std::string Name() const = 0;
};

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_REWRITER_INTERFACE_H_
