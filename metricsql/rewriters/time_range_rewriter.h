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

#ifndef METRICSQL_REWRITERS_TIME_RANGE_REWRITER_H_
#define METRICSQL_REWRITERS_TIME_RANGE_REWRITER_H_

#include "absl/status/statusor.h"
#include "metricsql/public/query.h"
#include "metricsql/public/rewriter_interface.h"

namespace metricsql {

// Resolves the relative parts of the query's time ranges into absolute
// [start, end) pairs. For a range not yet absolute:
//
//   end   = round(anchor) - offset
//   start = end - duration
//
// where the anchor is the range's end if set, else the execution time.
// A range with only a start runs forward from it instead. A comparison
// range carrying only an offset is the primary range shifted back by it.
const Rewriter* GetTimeRangeRewriter();

// Resolves one range. `primary` is the already resolved primary range when
// resolving a comparison range, null otherwise.
absl::StatusOr<TimeRange> ResolveTimeRange(const RewriteContext& context,
                                           const TimeRange& range,
                                           const TimeRange* primary);

}  // namespace metricsql

#endif  // METRICSQL_REWRITERS_TIME_RANGE_REWRITER_H_
