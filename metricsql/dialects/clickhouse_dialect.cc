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

#include "metricsql/dialects/clickhouse_dialect.h"

#include <string>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/public/time_grain.h"

namespace metricsql {

absl::StatusOr<std::string> ClickHouseDialect::DateTruncExpr(
    const DateTruncSpec& spec) const {
  METRICSQL_RET_CHECK(spec.grain != TimeGrain::kUnspecified);
  const std::string unit = absl::AsciiStrToUpper(TimeGrainName(spec.grain));
  const std::string time_zone =
      QuoteStringLiteral(spec.time_zone.empty() ? "UTC" : spec.time_zone);

  std::string shift;
  if (const int days = WeekStartShiftDays(spec); days > 0) {
    shift = absl::StrCat("INTERVAL ", days, " DAY");
  } else if (const int months = YearStartShiftMonths(spec); months > 0) {
    shift = absl::StrCat("INTERVAL ", months, " MONTH");
  }

  if (shift.empty()) {
    return absl::Substitute("toStartOfInterval($0, INTERVAL 1 $1, $2)",
                            spec.expr, unit, time_zone);
  }
  return absl::Substitute(
      "(toStartOfInterval($0 - $3, INTERVAL 1 $1, $2) + $3)", spec.expr, unit,
      time_zone, shift);
}

std::string ClickHouseDialect::JoinOnExpr(absl::string_view lhs,
                                          absl::string_view rhs) const {
  return absl::StrCat("isNotDistinctFrom(", lhs, ", ", rhs, ")");
}

std::string ClickHouseDialect::FirstValueAggregate(
    absl::string_view expr) const {
  return absl::StrCat("any(", expr, ")");
}

}  // namespace metricsql
