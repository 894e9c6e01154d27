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

#ifndef METRICSQL_PUBLIC_QUERY_H_
#define METRICSQL_PUBLIC_QUERY_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/time/time.h"
#include "metricsql/public/expression.h"
#include "metricsql/public/time_grain.h"

namespace metricsql {

// A requested dimension, optionally truncated to a time grain.
struct Dimension {
  std::string name;
  TimeGrain grain = TimeGrain::kUnspecified;
};

// Marks a requested measure as computed by the compiler instead of looked up
// in the metrics view.
struct MeasureCompute {
  enum Kind {
    // COUNT(*).
    COUNT,
    // COUNT(DISTINCT <dimension>); `target` names the dimension.
    COUNT_DISTINCT,
    // The `target` measure evaluated over the comparison time range.
    COMPARISON_VALUE,
    // target - comparison target.
    COMPARISON_DELTA,
    // (target - comparison target) / comparison target.
    COMPARISON_RATIO,
    // target / grand total * 100. `total` is filled by the percent-of-total
    // rewrite before the plan is built.
    PERCENT_OF_TOTAL,
  };

  Kind kind = COUNT;
  std::string target;
  std::optional<double> total;

  bool IsComparison() const {
    return kind == COMPARISON_VALUE || kind == COMPARISON_DELTA ||
           kind == COMPARISON_RATIO;
  }
};

// A requested measure. Without `compute`, `name` refers to a measure of the
// metrics view; with it, `name` is the output column name.
struct Measure {
  std::string name;
  std::optional<MeasureCompute> compute;
};

// Either an absolute [start, end) pair or a relative description that the
// time-range rewrite resolves into one. After resolution all relative fields
// are cleared; start and end are both set, or both unset meaning all time.
struct TimeRange {
  std::optional<absl::Time> start;
  std::optional<absl::Time> end;
  // Free-form: "inf", or "<iso duration> [offset <iso duration>]
  // [round <grain>]".
  std::string expression;
  // ISO-8601 duration, e.g. "P7D", "P1M", "PT6H".
  std::string iso_duration;
  // ISO-8601 duration the range is shifted back by.
  std::string iso_offset;
  TimeGrain round_to_grain = TimeGrain::kUnspecified;

  // True when no relative field is set.
  bool IsAbsolute() const {
    return expression.empty() && iso_duration.empty() && iso_offset.empty() &&
           round_to_grain == TimeGrain::kUnspecified;
  }
};

struct Sort {
  std::string name;
  bool desc = false;
};

// One analytical request against a metrics view.
//
// Invariants checked by ValidateQuery():
//  - `rows` and a non-empty `dimensions` are mutually exclusive.
//  - `limit` and `offset` are non-negative.
//  - every `sort` entry names a requested dimension or measure.
struct Query {
  std::string metrics_view;
  std::vector<Dimension> dimensions;
  std::vector<Measure> measures;
  std::optional<Expression> where;
  std::optional<Expression> having;
  std::optional<TimeRange> time_range;
  std::optional<TimeRange> comparison_time_range;
  std::vector<Sort> sort;
  std::optional<int64_t> limit;
  std::optional<int64_t> offset;
  // Return underlying rows instead of aggregates.
  bool rows = false;
  // Pivoting is done by a separate collaborator; the plan builder rejects it.
  std::vector<std::string> pivot_on;
  // IANA name; empty means the compiler options' time zone.
  std::string time_zone;
  // Output columns are named by display name instead of name.
  bool use_display_names = false;

  std::string DebugString() const;
};

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_QUERY_H_
