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

#ifndef METRICSQL_REWRITERS_APPROXIMATE_COMPARISON_JOIN_REWRITER_H_
#define METRICSQL_REWRITERS_APPROXIMATE_COMPARISON_JOIN_REWRITER_H_

#include "metricsql/public/rewriter_interface.h"

namespace metricsql {

// Replaces the full outer join of a period comparison with a one-sided join
// anchored on the period the query sorts by: a RIGHT join when the primary
// sort field comes from the comparison period, a LEFT join otherwise. Rows
// present only in the other period are dropped.
//
// When the root only reorders and limits the anchor's rows, the sort and
// limit are also pushed into the anchor block.
//
// Applies only when CompilerOptions::allow_approximate_comparisons() is set
// and the dialect supports approximate comparisons.
const Rewriter* GetApproximateComparisonJoinRewriter();

}  // namespace metricsql

#endif  // METRICSQL_REWRITERS_APPROXIMATE_COMPARISON_JOIN_REWRITER_H_
