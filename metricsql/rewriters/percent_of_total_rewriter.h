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

#ifndef METRICSQL_REWRITERS_PERCENT_OF_TOTAL_REWRITER_H_
#define METRICSQL_REWRITERS_PERCENT_OF_TOTAL_REWRITER_H_

#include "metricsql/public/query.h"
#include "metricsql/public/rewriter_interface.h"

namespace metricsql {

// Fills in the grand total of every percent-of-total measure that has none
// yet. The total is the target measure over the same filters and time range
// with no dimensions, obtained from the QueryExecutor. The plan builder then
// binds it as an argument of "value / ? * 100".
//
// Cancellation and deadline errors of the executor are returned with their
// code unchanged.
const Rewriter* GetPercentOfTotalRewriter();

// The query the grand total of `measure` is computed with.
Query MakeGrandTotalQuery(const Query& query, const MeasureCompute& measure);

}  // namespace metricsql

#endif  // METRICSQL_REWRITERS_PERCENT_OF_TOTAL_REWRITER_H_
