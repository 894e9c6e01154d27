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

#include "metricsql/dialects/duckdb_dialect.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/public/time_grain.h"

namespace metricsql {

absl::StatusOr<std::string> DuckDbDialect::DateTruncExpr(
    const DateTruncSpec& spec) const {
  METRICSQL_RET_CHECK(spec.grain != TimeGrain::kUnspecified);
  const bool is_utc = spec.time_zone.empty() || spec.time_zone == "UTC";
  const std::string time_zone = QuoteStringLiteral(spec.time_zone);

  // Truncation happens on wall-clock time in the target zone.
  std::string expr = spec.expr;
  if (!is_utc) {
    expr = absl::Substitute("timezone($0, $1::TIMESTAMPTZ)", time_zone, expr);
  }

  std::string shift;
  if (const int days = WeekStartShiftDays(spec); days > 0) {
    shift = absl::StrCat("INTERVAL ", days, " DAY");
  } else if (const int months = YearStartShiftMonths(spec); months > 0) {
    shift = absl::StrCat("INTERVAL ", months, " MONTH");
  }

  std::string truncated;
  if (shift.empty()) {
    truncated =
        absl::Substitute("date_trunc('$0', $1)", TimeGrainName(spec.grain),
                         expr);
  } else {
    truncated = absl::Substitute("(date_trunc('$0', $1 - $2) + $2)",
                                 TimeGrainName(spec.grain), expr, shift);
  }
  if (is_utc) return truncated;
  return absl::Substitute("timezone($0, $1)", time_zone, truncated);
}

}  // namespace metricsql
