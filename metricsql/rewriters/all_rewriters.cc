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

#include "metricsql/rewriters/all_rewriters.h"

#include "absl/base/call_once.h"
#include "metricsql/proto/options.pb.h"
#include "metricsql/rewriters/approximate_comparison_join_rewriter.h"
#include "metricsql/rewriters/dialect_normalization_rewriter.h"
#include "metricsql/rewriters/percent_of_total_rewriter.h"
#include "metricsql/rewriters/registration.h"
#include "metricsql/rewriters/row_cap_rewriter.h"
#include "metricsql/rewriters/time_range_rewriter.h"

namespace metricsql {

void RegisterBuiltinRewriters() {
  static absl::once_flag once_flag;
  absl::call_once(once_flag, [] {
    RewriteRegistry& r = RewriteRegistry::global_instance();

    // Rewriters are run in the order that they are registered, query
    // rewriters before the plan is built and plan rewriters after.

    // The grand total query carries the resolved time range, and the cap
    // applies to the query as the caller wrote it.
    r.Register(REWRITE_TIME_RANGE, GetTimeRangeRewriter());
    r.Register(REWRITE_ROW_CAP, GetRowCapRewriter());
    r.Register(REWRITE_PERCENT_OF_TOTAL, GetPercentOfTotalRewriter());

    // Join selection looks at plain passthrough fields, which normalization
    // wraps in aggregates.
    r.Register(REWRITE_APPROXIMATE_COMPARISON_JOIN,
               GetApproximateComparisonJoinRewriter());
    r.Register(REWRITE_DIALECT_NORMALIZATION,
               GetDialectNormalizationRewriter());
  });
}

}  // namespace metricsql
