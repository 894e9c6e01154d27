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

#ifndef METRICSQL_REWRITERS_REWRITE_PIPELINE_H_
#define METRICSQL_REWRITERS_REWRITE_PIPELINE_H_

#include "absl/status/status.h"
#include "metricsql/planner/plan_tree.h"
#include "metricsql/public/query.h"
#include "metricsql/public/rewriter_interface.h"

namespace metricsql {

// Runs the enabled rewriters of one stage over `query` or `tree`, in
// registration order. The first failure stops the run; it is returned
// tagged with the pass that failed, and the input must be discarded.
absl::Status RunQueryRewriters(const RewriteContext& context, Query* query,
                               RewriteOutputProperties& properties);
absl::Status RunPlanRewriters(const RewriteContext& context, PlanTree* tree,
                              RewriteOutputProperties& properties);

}  // namespace metricsql

#endif  // METRICSQL_REWRITERS_REWRITE_PIPELINE_H_
