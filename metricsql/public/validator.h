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

#ifndef METRICSQL_PUBLIC_VALIDATOR_H_
#define METRICSQL_PUBLIC_VALIDATOR_H_

#include "absl/status/status.h"
#include "metricsql/public/metrics_view.h"
#include "metricsql/public/query.h"
#include "metricsql/public/security_policy.h"

namespace metricsql {

// Checks that `query` is well formed against `view` before anything else
// runs. Never modifies the query and never talks to the database.
//
// Returns a VALIDATION error naming the offending field, e.g. "sort[1]" or
// "where", for:
//  - rows combined with dimensions, measures or having;
//  - names missing from the view, and duplicate output names;
//  - fields `security_policy` hides (kPermissionDenied);
//  - sort entries that are not requested fields;
//  - negative limit or offset, and having without measures;
//  - expressions that are not exactly one of name, value, condition or
//    subquery, or whose operands do not fit the operator;
//  - comparison measures without a comparison time range, time ranges on a
//    view without a time dimension, and unknown time zones.
//
// `security_policy` may be null for unrestricted access.
absl::Status ValidateQuery(const Query& query, const MetricsView& view,
                           const SecurityPolicy* security_policy);

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_VALIDATOR_H_
