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

#ifndef METRICSQL_DIALECTS_DRUID_DIALECT_H_
#define METRICSQL_DIALECTS_DRUID_DIALECT_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "metricsql/public/dialect.h"

namespace metricsql {

// Apache Druid SQL. No ILIKE, no IS NOT DISTINCT FROM and no approximate
// comparisons. Applies a default row cap of 10000.
class DruidDialect : public Dialect {
 public:
  std::string Name() const override { return "druid"; }
  bool SupportsILike() const override { return false; }
  absl::StatusOr<std::string> DateTruncExpr(
      const DateTruncSpec& spec) const override;
  std::string JoinOnExpr(absl::string_view lhs,
                         absl::string_view rhs) const override;
  bool SupportsApproximateComparisons() const override { return false; }
  bool RequiresGroupingForJoins() const override { return true; }
  int64_t DefaultRowCap() const override { return 10000; }
};

}  // namespace metricsql

#endif  // METRICSQL_DIALECTS_DRUID_DIALECT_H_
