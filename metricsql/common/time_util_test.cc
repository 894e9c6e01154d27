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

#include "metricsql/base/testing/status_matchers.h"
#include "metricsql/public/time_grain.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"

namespace metricsql {
namespace {

using ::testing::HasSubstr;
using metricsql_base::testing::IsOkAndHolds;
using metricsql_base::testing::StatusIs;

absl::Time Utc(int year, int month, int day, int hour = 0, int minute = 0,
               int second = 0) {
  return absl::FromCivil(
      absl::CivilSecond(year, month, day, hour, minute, second),
      absl::UTCTimeZone());
}

TEST(IsoDurationTest, ParsesAllComponents) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(IsoDuration duration,
                                 ParseIsoDuration("P1Y2M3W4DT5H6M7S"));
  EXPECT_EQ(duration.years, 1);
  EXPECT_EQ(duration.months, 2);
  EXPECT_EQ(duration.weeks, 3);
  EXPECT_EQ(duration.days, 4);
  EXPECT_EQ(duration.hours, 5);
  EXPECT_EQ(duration.minutes, 6);
  EXPECT_EQ(duration.seconds, 7);
  EXPECT_EQ(duration.DebugString(), "P1Y2M3W4DT5H6M7S");

  METRICSQL_ASSERT_OK_AND_ASSIGN(duration, ParseIsoDuration("PT6H"));
  EXPECT_EQ(duration.hours, 6);
  EXPECT_EQ(duration.days, 0);
  EXPECT_FALSE(duration.IsZero());
}

TEST(IsoDurationTest, RejectsMalformedDurations) {
  for (absl::string_view text : {"", "1D", "P1.5D", "P1H", "PT", "P1DT",
                                 "p1d", "P-1D", "P1D "}) {
    EXPECT_THAT(ParseIsoDuration(text),
                StatusIs(absl::StatusCode::kInvalidArgument,
                         HasSubstr("Invalid ISO-8601 duration")))
        << text;
  }
  EXPECT_THAT(ParseIsoDuration("P"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("has no components")));
  EXPECT_THAT(ParseIsoDuration("P99999999999999999999D"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("out of range")));
  for (absl::string_view text :
       {"P999999999999999999Y", "P10001Y", "P120001M",
        "PT999999999999999999S", "P1Y999999999999999999W"}) {
    EXPECT_THAT(ParseIsoDuration(text),
                StatusIs(absl::StatusCode::kInvalidArgument,
                         HasSubstr("out of range")))
        << text;
  }
  METRICSQL_ASSERT_OK_AND_ASSIGN(IsoDuration longest,
                                 ParseIsoDuration("P10000Y"));
  EXPECT_EQ(longest.years, 10000);
}

TEST(IsoDurationTest, DebugStringOfZero) {
  EXPECT_EQ(IsoDuration().DebugString(), "PT0S");
  EXPECT_TRUE(IsoDuration().IsZero());
  IsoDuration duration;
  duration.days = 1;
  duration.hours = 6;
  EXPECT_EQ(duration.DebugString(), "P1DT6H");
}

TEST(IsoDurationTest, CalendarArithmeticClampsToMonthEnd) {
  const absl::TimeZone utc = absl::UTCTimeZone();
  IsoDuration month;
  month.months = 1;
  EXPECT_EQ(SubtractIsoDuration(Utc(2024, 3, 31, 12), month, utc),
            Utc(2024, 2, 29, 12));
  EXPECT_EQ(AddIsoDuration(Utc(2023, 1, 31), month, utc), Utc(2023, 2, 28));

  IsoDuration year;
  year.years = 1;
  EXPECT_EQ(SubtractIsoDuration(Utc(2024, 2, 29), year, utc),
            Utc(2023, 2, 28));
}

TEST(IsoDurationTest, MixedComponents) {
  const absl::TimeZone utc = absl::UTCTimeZone();
  METRICSQL_ASSERT_OK_AND_ASSIGN(IsoDuration duration,
                                 ParseIsoDuration("P1W2DT3H30M"));
  EXPECT_EQ(SubtractIsoDuration(Utc(2024, 3, 13, 12), duration, utc),
            Utc(2024, 3, 4, 8, 30));
  EXPECT_EQ(AddIsoDuration(Utc(2024, 3, 4, 8, 30), duration, utc),
            Utc(2024, 3, 13, 12));

  IsoDuration day;
  day.days = 1;
  const absl::Time fractional = Utc(2024, 1, 1) + absl::Milliseconds(500);
  EXPECT_EQ(SubtractIsoDuration(fractional, day, utc),
            Utc(2023, 12, 31) + absl::Milliseconds(500));
}

TEST(TruncateToGrainTest, Utc) {
  const absl::TimeZone utc = absl::UTCTimeZone();
  // A Wednesday.
  const absl::Time time =
      Utc(2024, 3, 13, 15, 45, 30) + absl::Microseconds(123456);
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kUnspecified, utc), time);
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kMillisecond, utc),
            Utc(2024, 3, 13, 15, 45, 30) + absl::Milliseconds(123));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kSecond, utc),
            Utc(2024, 3, 13, 15, 45, 30));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kMinute, utc),
            Utc(2024, 3, 13, 15, 45));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kHour, utc),
            Utc(2024, 3, 13, 15));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kDay, utc), Utc(2024, 3, 13));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kWeek, utc), Utc(2024, 3, 11));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kMonth, utc), Utc(2024, 3, 1));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kQuarter, utc), Utc(2024, 1, 1));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kYear, utc), Utc(2024, 1, 1));
}

TEST(TruncateToGrainTest, CalendarSettings) {
  const absl::TimeZone utc = absl::UTCTimeZone();
  const absl::Time time = Utc(2024, 3, 13, 15);
  // Weeks starting on Sunday and on Thursday.
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kWeek, utc, 7), Utc(2024, 3, 10));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kWeek, utc, 4), Utc(2024, 3, 7));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kWeek, utc, 3), Utc(2024, 3, 13));
  // Fiscal years starting in February and in April.
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kQuarter, utc, 1, 2),
            Utc(2024, 2, 1));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kYear, utc, 1, 4),
            Utc(2023, 4, 1));
}

TEST(TruncateToGrainTest, FixedOffsetZone) {
  const absl::TimeZone zone = absl::FixedTimeZone(-5 * 60 * 60);
  // 22:00 on March 12 local time.
  const absl::Time time = Utc(2024, 3, 13, 3);
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kDay, zone),
            Utc(2024, 3, 12, 5));
  EXPECT_EQ(TruncateToGrain(time, TimeGrain::kMonth, zone),
            Utc(2024, 3, 1, 5));
}

TEST(FindTimeZoneByNameTest, LoadsKnownZones) {
  absl::TimeZone zone;
  METRICSQL_EXPECT_OK(FindTimeZoneByName("UTC", &zone));
  EXPECT_EQ(zone, absl::UTCTimeZone());
  EXPECT_THAT(FindTimeZoneByName("Mars/Olympus", &zone),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Invalid time zone: Mars/Olympus")));
}

TEST(TimeRangeExpressionTest, AllTime) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(TimeRangeExpression expr,
                                 ParseTimeRangeExpression(" INF "));
  EXPECT_TRUE(expr.all_time);
  EXPECT_TRUE(expr.iso_duration.empty());
}

TEST(TimeRangeExpressionTest, DurationOffsetAndRounding) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(
      TimeRangeExpression expr,
      ParseTimeRangeExpression("p7d OFFSET p1w round Week"));
  EXPECT_FALSE(expr.all_time);
  EXPECT_EQ(expr.iso_duration, "P7D");
  EXPECT_EQ(expr.iso_offset, "P1W");
  EXPECT_EQ(expr.round_to_grain, TimeGrain::kWeek);

  METRICSQL_ASSERT_OK_AND_ASSIGN(expr, ParseTimeRangeExpression("PT6H"));
  EXPECT_EQ(expr.iso_duration, "PT6H");
  EXPECT_TRUE(expr.iso_offset.empty());
  EXPECT_EQ(expr.round_to_grain, TimeGrain::kUnspecified);
}

TEST(TimeRangeExpressionTest, Errors) {
  EXPECT_THAT(ParseTimeRangeExpression("last week"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Invalid time range expression")));
  EXPECT_THAT(ParseTimeRangeExpression("P7D round fortnight"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Unknown time grain: fortnight")));
}

TEST(TimeGrainTest, Names) {
  EXPECT_EQ(TimeGrainName(TimeGrain::kQuarter), "quarter");
  EXPECT_EQ(TimeGrainName(TimeGrain::kUnspecified), "");
  EXPECT_THAT(ParseTimeGrain("HOUR"), IsOkAndHolds(TimeGrain::kHour));
  EXPECT_THAT(ParseTimeGrain("millisecond"),
              IsOkAndHolds(TimeGrain::kMillisecond));
  EXPECT_THAT(ParseTimeGrain(""),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace
}  // namespace metricsql
