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

#ifndef METRICSQL_COMMON_TIME_UTIL_H_
#define METRICSQL_COMMON_TIME_UTIL_H_

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "metricsql/public/time_grain.h"

namespace metricsql {

// An ISO-8601 duration, PnYnMnWnDTnHnMnS, with non-negative integer
// components. Year, month, week and day components are calendar relative;
// the rest are fixed lengths.
struct IsoDuration {
  int64_t years = 0;
  int64_t months = 0;
  int64_t weeks = 0;
  int64_t days = 0;
  int64_t hours = 0;
  int64_t minutes = 0;
  int64_t seconds = 0;

  bool IsZero() const {
    return years == 0 && months == 0 && weeks == 0 && days == 0 &&
           hours == 0 && minutes == 0 && seconds == 0;
  }
  std::string DebugString() const;
};

// Parses e.g. "P1D", "P1Y2M", "PT6H", "P2W". Returns kInvalidArgument for
// anything else, including "P" and "PT" with no component.
absl::StatusOr<IsoDuration> ParseIsoDuration(absl::string_view text);

// Returns `time` moved back (SubtractIsoDuration) or forward
// (AddIsoDuration) by `duration`, with calendar components applied to the
// civil time in `zone`. A day of month past the end of the target month is
// clamped to its last day, so 2024-03-31 minus P1M is 2024-02-29.
absl::Time SubtractIsoDuration(absl::Time time, const IsoDuration& duration,
                               absl::TimeZone zone);
absl::Time AddIsoDuration(absl::Time time, const IsoDuration& duration,
                          absl::TimeZone zone);

// Truncates `time` down to the start of its `grain` in `zone`. Weeks start on
// `first_day_of_week` (1 = Monday ... 7 = Sunday); quarters and years are
// aligned to `first_month_of_year` (1 = January ... 12 = December).
// kUnspecified returns `time` unchanged.
absl::Time TruncateToGrain(absl::Time time, TimeGrain grain,
                           absl::TimeZone zone, int first_day_of_week = 1,
                           int first_month_of_year = 1);

// Loads an IANA time zone. Returns kInvalidArgument for unknown names.
absl::Status FindTimeZoneByName(absl::string_view name, absl::TimeZone* zone);

// The parsed form of a free-form time range expression:
//
//   inf
//   <iso duration> [offset <iso duration>] [round <grain>]
//
// Keywords are case-insensitive.
struct TimeRangeExpression {
  // "inf": the range covers all time.
  bool all_time = false;
  std::string iso_duration;
  std::string iso_offset;
  TimeGrain round_to_grain = TimeGrain::kUnspecified;
};

absl::StatusOr<TimeRangeExpression> ParseTimeRangeExpression(
    absl::string_view text);

}  // namespace metricsql

#endif  // METRICSQL_COMMON_TIME_UTIL_H_
