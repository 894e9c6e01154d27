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

#include "metricsql/public/query.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/time/time.h"

namespace metricsql {

namespace {

std::string FormatTimeOrUnset(const std::optional<absl::Time>& t) {
  if (!t.has_value()) return "unset";
  return absl::FormatTime(absl::RFC3339_full, *t, absl::UTCTimeZone());
}

std::string TimeRangeDebugString(const TimeRange& range) {
  std::string out = absl::StrCat("[", FormatTimeOrUnset(range.start), ", ",
                                  FormatTimeOrUnset(range.end), ")");
  if (!range.expression.empty()) {
    absl::StrAppend(&out, " expression=", range.expression);
  }
  if (!range.iso_duration.empty()) {
    absl::StrAppend(&out, " duration=", range.iso_duration);
  }
  if (!range.iso_offset.empty()) {
    absl::StrAppend(&out, " offset=", range.iso_offset);
  }
  if (range.round_to_grain != TimeGrain::kUnspecified) {
    absl::StrAppend(&out, " round=", TimeGrainName(range.round_to_grain));
  }
  return out;
}

}  // namespace

std::string Query::DebugString() const {
  std::string out = absl::StrCat("Query(", metrics_view);
  absl::StrAppend(
      &out, " dimensions=[",
      absl::StrJoin(dimensions, ", ",
                    [](std::string* s, const Dimension& d) {
                      absl::StrAppend(s, d.name);
                      if (d.grain != TimeGrain::kUnspecified) {
                        absl::StrAppend(s, "@", TimeGrainName(d.grain));
                      }
                    }),
      "]");
  absl::StrAppend(&out, " measures=[",
                  absl::StrJoin(measures, ", ",
                                [](std::string* s, const Measure& m) {
                                  absl::StrAppend(s, m.name);
                                }),
                  "]");
  if (where.has_value()) {
    absl::StrAppend(&out, " where=", where->DebugString());
  }
  if (having.has_value()) {
    absl::StrAppend(&out, " having=", having->DebugString());
  }
  if (time_range.has_value()) {
    absl::StrAppend(&out, " time_range=", TimeRangeDebugString(*time_range));
  }
  if (comparison_time_range.has_value()) {
    absl::StrAppend(&out, " comparison_time_range=",
                    TimeRangeDebugString(*comparison_time_range));
  }
  if (!sort.empty()) {
    absl::StrAppend(&out, " sort=[",
                    absl::StrJoin(sort, ", ",
                                  [](std::string* s, const Sort& field) {
                                    absl::StrAppend(s, field.name,
                                                    field.desc ? " desc" : "");
                                  }),
                    "]");
  }
  if (limit.has_value()) absl::StrAppend(&out, " limit=", *limit);
  if (offset.has_value()) absl::StrAppend(&out, " offset=", *offset);
  if (rows) absl::StrAppend(&out, " rows");
  absl::StrAppend(&out, ")");
  return out;
}

}  // namespace metricsql
