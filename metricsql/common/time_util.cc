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

#include "metricsql/common/time_util.h"

#include <algorithm>
#include <cstdint>
#include <string>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/time/civil_time.h"
#include "metricsql/base/status_builder.h"
#include "metricsql/base/status_macros.h"
#include "re2/re2.h"

namespace metricsql {

namespace {

// P[nY][nM][nW][nD][T[nH][nM][nS]]
const LazyRE2 kReIsoDuration = {
    R"(P(?:(\d+)Y)?(?:(\d+)M)?(?:(\d+)W)?(?:(\d+)D)?(?:T(?:(\d+)H)?(?:(\d+)M)?(?:(\d+)S)?)?)"};
const LazyRE2 kReAllTime = {R"((?i)\s*inf\s*)"};
// <duration> [offset <duration>] [round <grain>]
const LazyRE2 kReTimeRangeExpression = {
    R"((?i)\s*(P[0-9A-Z]+)(?:\s+offset\s+(P[0-9A-Z]+))?(?:\s+round\s+([a-z]+))?\s*)"};

// Each component is at most about 10000 years so that the calendar arithmetic
// in ApplyIsoDuration cannot overflow.
constexpr int64_t kMaxYears = 10000;
constexpr int64_t kMaxMonths = kMaxYears * 12;
constexpr int64_t kMaxWeeks = kMaxYears * 53;
constexpr int64_t kMaxDays = kMaxYears * 366;
constexpr int64_t kMaxHours = kMaxDays * 24;
constexpr int64_t kMaxMinutes = kMaxHours * 60;
constexpr int64_t kMaxSeconds = kMaxMinutes * 60;

// Empty components are zero.
absl::Status ParseComponent(const std::string& text, absl::string_view input,
                            int64_t max_value, int64_t* value) {
  if (text.empty()) {
    *value = 0;
    return absl::OkStatus();
  }
  if (!absl::SimpleAtoi(text, value) || *value > max_value) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "Invalid ISO-8601 duration '" << input
           << "': component out of range";
  }
  return absl::OkStatus();
}

int DaysInMonth(absl::CivilMonth month) {
  return (absl::CivilDay(month + 1) - 1).day();
}

// Moves `time` by `sign` times `duration`.
absl::Time ApplyIsoDuration(absl::Time time, const IsoDuration& duration,
                            absl::TimeZone zone, int sign) {
  const absl::CivilSecond civil = absl::ToCivilSecond(time, zone);
  const absl::CivilMonth month =
      absl::CivilMonth(civil) + sign * (duration.years * 12 + duration.months);
  const int day = std::min(civil.day(), DaysInMonth(month));
  absl::CivilDay civil_day(month.year(), month.month(), day);
  civil_day += sign * (duration.weeks * 7 + duration.days);
  const absl::CivilSecond shifted(civil_day.year(), civil_day.month(),
                                  civil_day.day(), civil.hour(),
                                  civil.minute(), civil.second());
  // Sub-second precision is not representable in civil time.
  const absl::Duration subsecond = time - absl::FromCivil(civil, zone);
  const absl::Duration fixed = absl::Hours(duration.hours) +
                               absl::Minutes(duration.minutes) +
                               absl::Seconds(duration.seconds);
  return absl::FromCivil(shifted, zone) + subsecond + sign * fixed;
}

int WeekdayIndex(absl::Weekday weekday) {
  switch (weekday) {
    case absl::Weekday::monday:
      return 0;
    case absl::Weekday::tuesday:
      return 1;
    case absl::Weekday::wednesday:
      return 2;
    case absl::Weekday::thursday:
      return 3;
    case absl::Weekday::friday:
      return 4;
    case absl::Weekday::saturday:
      return 5;
    case absl::Weekday::sunday:
      return 6;
  }
  return 0;
}

int PositiveModulo(int value, int divisor) {
  return ((value % divisor) + divisor) % divisor;
}

}  // namespace

std::string IsoDuration::DebugString() const {
  std::string out = "P";
  if (years != 0) absl::StrAppend(&out, years, "Y");
  if (months != 0) absl::StrAppend(&out, months, "M");
  if (weeks != 0) absl::StrAppend(&out, weeks, "W");
  if (days != 0) absl::StrAppend(&out, days, "D");
  if (hours != 0 || minutes != 0 || seconds != 0) {
    absl::StrAppend(&out, "T");
    if (hours != 0) absl::StrAppend(&out, hours, "H");
    if (minutes != 0) absl::StrAppend(&out, minutes, "M");
    if (seconds != 0) absl::StrAppend(&out, seconds, "S");
  }
  if (out == "P") out = "PT0S";
  return out;
}

absl::StatusOr<IsoDuration> ParseIsoDuration(absl::string_view text) {
  std::string years, months, weeks, days, hours, minutes, seconds;
  if (text.empty() || text.back() == 'T' ||
      !RE2::FullMatch(text, *kReIsoDuration, &years, &months, &weeks, &days,
                      &hours, &minutes, &seconds)) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "Invalid ISO-8601 duration '" << text << "'";
  }
  if (years.empty() && months.empty() && weeks.empty() && days.empty() &&
      hours.empty() && minutes.empty() && seconds.empty()) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "ISO-8601 duration '" << text << "' has no components";
  }
  IsoDuration duration;
  METRICSQL_RETURN_IF_ERROR(
      ParseComponent(years, text, kMaxYears, &duration.years));
  METRICSQL_RETURN_IF_ERROR(
      ParseComponent(months, text, kMaxMonths, &duration.months));
  METRICSQL_RETURN_IF_ERROR(
      ParseComponent(weeks, text, kMaxWeeks, &duration.weeks));
  METRICSQL_RETURN_IF_ERROR(
      ParseComponent(days, text, kMaxDays, &duration.days));
  METRICSQL_RETURN_IF_ERROR(
      ParseComponent(hours, text, kMaxHours, &duration.hours));
  METRICSQL_RETURN_IF_ERROR(
      ParseComponent(minutes, text, kMaxMinutes, &duration.minutes));
  METRICSQL_RETURN_IF_ERROR(
      ParseComponent(seconds, text, kMaxSeconds, &duration.seconds));
  return duration;
}

absl::Time SubtractIsoDuration(absl::Time time, const IsoDuration& duration,
                               absl::TimeZone zone) {
  return ApplyIsoDuration(time, duration, zone, -1);
}

absl::Time AddIsoDuration(absl::Time time, const IsoDuration& duration,
                          absl::TimeZone zone) {
  return ApplyIsoDuration(time, duration, zone, 1);
}

absl::Time TruncateToGrain(absl::Time time, TimeGrain grain,
                           absl::TimeZone zone, int first_day_of_week,
                           int first_month_of_year) {
  switch (grain) {
    case TimeGrain::kUnspecified:
      return time;
    case TimeGrain::kMillisecond:
      return absl::FromUnixMillis(absl::ToUnixMillis(time));
    case TimeGrain::kSecond:
      return absl::FromCivil(absl::ToCivilSecond(time, zone), zone);
    case TimeGrain::kMinute:
      return absl::FromCivil(absl::ToCivilMinute(time, zone), zone);
    case TimeGrain::kHour:
      return absl::FromCivil(absl::ToCivilHour(time, zone), zone);
    case TimeGrain::kDay:
      return absl::FromCivil(absl::ToCivilDay(time, zone), zone);
    case TimeGrain::kWeek: {
      const absl::CivilDay day = absl::ToCivilDay(time, zone);
      const int offset = PositiveModulo(
          WeekdayIndex(absl::GetWeekday(day)) - (first_day_of_week - 1), 7);
      return absl::FromCivil(day - offset, zone);
    }
    case TimeGrain::kMonth:
      return absl::FromCivil(absl::ToCivilMonth(time, zone), zone);
    case TimeGrain::kQuarter:
    case TimeGrain::kYear: {
      const absl::CivilMonth month = absl::ToCivilMonth(time, zone);
      const int period = grain == TimeGrain::kYear ? 12 : 3;
      const int offset =
          PositiveModulo(month.month() - first_month_of_year, period);
      return absl::FromCivil(month - offset, zone);
    }
  }
  return time;
}

absl::Status FindTimeZoneByName(absl::string_view name, absl::TimeZone* zone) {
  if (!absl::LoadTimeZone(name, zone)) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "Invalid time zone: " << name;
  }
  return absl::OkStatus();
}

absl::StatusOr<TimeRangeExpression> ParseTimeRangeExpression(
    absl::string_view text) {
  TimeRangeExpression result;
  if (RE2::FullMatch(text, *kReAllTime)) {
    result.all_time = true;
    return result;
  }
  std::string grain;
  if (!RE2::FullMatch(text, *kReTimeRangeExpression, &result.iso_duration,
                      &result.iso_offset, &grain)) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "Invalid time range expression '" << text << "'";
  }
  result.iso_duration = absl::AsciiStrToUpper(result.iso_duration);
  result.iso_offset = absl::AsciiStrToUpper(result.iso_offset);
  if (!grain.empty()) {
    METRICSQL_ASSIGN_OR_RETURN(result.round_to_grain, ParseTimeGrain(grain));
  }
  return result;
}

}  // namespace metricsql
