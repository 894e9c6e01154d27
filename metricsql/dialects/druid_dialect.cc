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

#include "metricsql/dialects/druid_dialect.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "metricsql/common/errors.h"
#include "metricsql/public/time_grain.h"

namespace metricsql {

namespace {

// ISO-8601 period accepted by TIME_FLOOR, or empty if none.
absl::string_view GrainPeriod(TimeGrain grain) {
  switch (grain) {
    case TimeGrain::kMillisecond:
      return "PT0.001S";
    case TimeGrain::kSecond:
      return "PT1S";
    case TimeGrain::kMinute:
      return "PT1M";
    case TimeGrain::kHour:
      return "PT1H";
    case TimeGrain::kDay:
      return "P1D";
    case TimeGrain::kWeek:
      return "P1W";
    case TimeGrain::kMonth:
      return "P1M";
    case TimeGrain::kQuarter:
      return "P3M";
    case TimeGrain::kYear:
      return "P1Y";
    case TimeGrain::kUnspecified:
      break;
  }
  return "";
}

}  // namespace

absl::StatusOr<std::string> DruidDialect::DateTruncExpr(
    const DateTruncSpec& spec) const {
  const absl::string_view period = GrainPeriod(spec.grain);
  if (period.empty()) {
    return MakeCompileInvariantError()
           << "No time grain to truncate " << spec.expr << " to";
  }
  const std::string time_zone =
      QuoteStringLiteral(spec.time_zone.empty() ? "UTC" : spec.time_zone);

  absl::string_view shift_period;
  int shift = 0;
  if (const int days = WeekStartShiftDays(spec); days > 0) {
    shift_period = "P1D";
    shift = days;
  } else if (const int months = YearStartShiftMonths(spec); months > 0) {
    shift_period = "P1M";
    shift = months;
  }

  if (shift == 0) {
    return absl::Substitute("TIME_FLOOR($0, '$1', NULL, $2)", spec.expr,
                            period, time_zone);
  }
  return absl::Substitute(
      "TIME_SHIFT(TIME_FLOOR(TIME_SHIFT($0, '$3', -$4, $2), '$1', NULL, $2), "
      "'$3', $4, $2)",
      spec.expr, period, time_zone, shift_period, shift);
}

std::string DruidDialect::JoinOnExpr(absl::string_view lhs,
                                     absl::string_view rhs) const {
  return absl::Substitute("($0 = $1 OR ($0 IS NULL AND $1 IS NULL))", lhs,
                          rhs);
}

}  // namespace metricsql
