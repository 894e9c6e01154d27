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

#include "metricsql/public/time_grain.h"

#include <string>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

namespace metricsql {

namespace {

constexpr TimeGrain kAllGrains[] = {
    TimeGrain::kMillisecond, TimeGrain::kSecond, TimeGrain::kMinute,
    TimeGrain::kHour,        TimeGrain::kDay,    TimeGrain::kWeek,
    TimeGrain::kMonth,       TimeGrain::kQuarter, TimeGrain::kYear,
};

}  // namespace

absl::string_view TimeGrainName(TimeGrain grain) {
  switch (grain) {
    case TimeGrain::kUnspecified:
      return "";
    case TimeGrain::kMillisecond:
      return "millisecond";
    case TimeGrain::kSecond:
      return "second";
    case TimeGrain::kMinute:
      return "minute";
    case TimeGrain::kHour:
      return "hour";
    case TimeGrain::kDay:
      return "day";
    case TimeGrain::kWeek:
      return "week";
    case TimeGrain::kMonth:
      return "month";
    case TimeGrain::kQuarter:
      return "quarter";
    case TimeGrain::kYear:
      return "year";
  }
  return "";
}

absl::StatusOr<TimeGrain> ParseTimeGrain(absl::string_view name) {
  const std::string lower = absl::AsciiStrToLower(name);
  for (TimeGrain grain : kAllGrains) {
    if (lower == TimeGrainName(grain)) {
      return grain;
    }
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown time grain: ", name));
}

}  // namespace metricsql
