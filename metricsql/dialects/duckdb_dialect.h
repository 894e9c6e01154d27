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

#ifndef METRICSQL_DIALECTS_DUCKDB_DIALECT_H_
#define METRICSQL_DIALECTS_DUCKDB_DIALECT_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "metricsql/public/dialect.h"

namespace metricsql {

// DuckDB. Native ILIKE, IS NOT DISTINCT FROM joins and relaxed grouping with
// join children. Time grains use date_trunc with interval shifts for custom
// week and year starts.
class DuckDbDialect : public Dialect {
 public:
  std::string Name() const override { return "duckdb"; }
  bool SupportsILike() const override { return true; }
  absl::StatusOr<std::string> DateTruncExpr(
      const DateTruncSpec& spec) const override;
  bool SupportsApproximateComparisons() const override { return true; }
  bool RequiresGroupingForJoins() const override { return false; }
};

}  // namespace metricsql

#endif  // METRICSQL_DIALECTS_DUCKDB_DIALECT_H_
