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

#include "metricsql/rewriters/time_range_rewriter.h"

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/base/status_macros.h"
#include "metricsql/common/errors.h"
#include "metricsql/common/time_util.h"
#include "metricsql/proto/options.pb.h"

namespace metricsql {

namespace {

bool IsOffsetOnly(const TimeRange& range) {
  return !range.start.has_value() && !range.end.has_value() &&
         range.expression.empty() && range.iso_duration.empty() &&
         !range.iso_offset.empty() &&
         range.round_to_grain == TimeGrain::kUnspecified;
}

class TimeRangeRewriter : public Rewriter {
 public:
  Stage stage() const override { return QUERY; }

  absl::Status RewriteQuery(const RewriteContext& context, Query* query,
                            RewriteOutputProperties& properties) const override {
    if (query->time_range.has_value()) {
      METRICSQL_ASSIGN_OR_RETURN(
          query->time_range,
          ResolveTimeRange(context, *query->time_range, /*primary=*/nullptr));
    }
    if (query->comparison_time_range.has_value()) {
      const TimeRange* primary =
          query->time_range.has_value() ? &*query->time_range : nullptr;
      METRICSQL_ASSIGN_OR_RETURN(
          query->comparison_time_range,
          ResolveTimeRange(context, *query->comparison_time_range, primary));
    }
    return absl::OkStatus();
  }

  std::string Name() const override { return "TimeRangeRewriter"; }
};

}  // namespace

absl::StatusOr<TimeRange> ResolveTimeRange(const RewriteContext& context,
                                           const TimeRange& range,
                                           const TimeRange* primary) {
  if (range.IsAbsolute()) {
    TimeRange resolved = range;
    // An open end is the execution time.
    if (resolved.start.has_value() && !resolved.end.has_value()) {
      resolved.end = context.now;
    }
    if (!resolved.start.has_value() && resolved.end.has_value()) {
      return MakeRewriteError(REWRITE_TIME_RANGE)
             << "Time range ends at " << absl::FormatTime(*resolved.end)
             << " but has no start";
    }
    if (resolved.start.has_value() && *resolved.start > *resolved.end) {
      return MakeRewriteError(REWRITE_TIME_RANGE)
             << "Time range ends at " << absl::FormatTime(*resolved.end)
             << ", before its start " << absl::FormatTime(*resolved.start);
    }
    return resolved;
  }

  if (IsOffsetOnly(range)) {
    if (primary == nullptr) {
      return MakeRewriteError(REWRITE_TIME_RANGE)
             << "A comparison time range with only an offset requires a "
                "time range to shift";
    }
    if (!primary->start.has_value() && !primary->end.has_value()) {
      return MakeRewriteError(REWRITE_TIME_RANGE)
             << "Cannot shift an unbounded time range by "
             << range.iso_offset;
    }
    METRICSQL_ASSIGN_OR_RETURN(IsoDuration offset,
                               ParseIsoDuration(range.iso_offset));
    TimeRange resolved;
    if (primary->start.has_value()) {
      resolved.start =
          SubtractIsoDuration(*primary->start, offset, context.time_zone);
    }
    if (primary->end.has_value()) {
      resolved.end =
          SubtractIsoDuration(*primary->end, offset, context.time_zone);
    }
    return resolved;
  }

  std::string iso_duration = range.iso_duration;
  std::string iso_offset = range.iso_offset;
  TimeGrain round_to_grain = range.round_to_grain;
  if (!range.expression.empty()) {
    if (!iso_duration.empty() || !iso_offset.empty() ||
        round_to_grain != TimeGrain::kUnspecified) {
      return MakeRewriteError(REWRITE_TIME_RANGE)
             << "Time range expression \"" << range.expression
             << "\" cannot be combined with a duration, offset or grain";
    }
    METRICSQL_ASSIGN_OR_RETURN(TimeRangeExpression parsed,
                               ParseTimeRangeExpression(range.expression));
    if (parsed.all_time) {
      return TimeRange();
    }
    iso_duration = parsed.iso_duration;
    iso_offset = parsed.iso_offset;
    round_to_grain = parsed.round_to_grain;
  }

  std::optional<IsoDuration> duration;
  if (!iso_duration.empty()) {
    METRICSQL_ASSIGN_OR_RETURN(duration, ParseIsoDuration(iso_duration));
  }
  IsoDuration offset;
  if (!iso_offset.empty()) {
    METRICSQL_ASSIGN_OR_RETURN(offset, ParseIsoDuration(iso_offset));
  }
  const absl::TimeZone zone = context.time_zone;
  auto round = [&](absl::Time time) {
    return TruncateToGrain(time, round_to_grain, zone,
                           context.first_day_of_week,
                           context.first_month_of_year);
  };

  TimeRange resolved;
  if (range.start.has_value() && range.end.has_value()) {
    if (duration.has_value()) {
      return MakeRewriteError(REWRITE_TIME_RANGE)
             << "A time range with both start and end cannot also have the "
                "duration "
             << iso_duration;
    }
    resolved.start = SubtractIsoDuration(round(*range.start), offset, zone);
    resolved.end = SubtractIsoDuration(round(*range.end), offset, zone);
  } else if (range.start.has_value()) {
    // Runs forward from the start.
    resolved.start = SubtractIsoDuration(round(*range.start), offset, zone);
    resolved.end = duration.has_value()
                       ? AddIsoDuration(*resolved.start, *duration, zone)
                       : context.now;
  } else {
    // Runs backward from the end.
    if (!duration.has_value()) {
      return MakeRewriteError(REWRITE_TIME_RANGE)
             << "A time range without a start requires a duration";
    }
    const absl::Time anchor = range.end.value_or(context.now);
    resolved.end = SubtractIsoDuration(round(anchor), offset, zone);
    resolved.start = SubtractIsoDuration(*resolved.end, *duration, zone);
  }

  METRICSQL_RET_CHECK(resolved.start.has_value() && resolved.end.has_value());
  if (*resolved.start > *resolved.end) {
    return MakeRewriteError(REWRITE_TIME_RANGE)
           << "Time range ends at " << absl::FormatTime(*resolved.end)
           << ", before its start " << absl::FormatTime(*resolved.start);
  }
  return resolved;
}

const Rewriter* GetTimeRangeRewriter() {
  static const Rewriter* rewriter = new TimeRangeRewriter();
  return rewriter;
}

}  // namespace metricsql
