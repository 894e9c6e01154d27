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

#ifndef METRICSQL_PUBLIC_TIME_GRAIN_H_
#define METRICSQL_PUBLIC_TIME_GRAIN_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace metricsql {

// Time truncation granularities, finest first.
enum class TimeGrain {
  kUnspecified,
  kMillisecond,
  kSecond,
  kMinute,
  kHour,
  kDay,
  kWeek,
  kMonth,
  kQuarter,
  kYear,
};

// "millisecond", "second", ... "year". Empty for kUnspecified.
absl::string_view TimeGrainName(TimeGrain grain);

// Inverse of TimeGrainName, case-insensitive.
absl::StatusOr<TimeGrain> ParseTimeGrain(absl::string_view name);

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_TIME_GRAIN_H_
