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

#include "metricsql/public/compiler_options.h"

#include <utility>

#include "absl/time/time.h"
#include "metricsql/base/status_builder.h"
#include "metricsql/base/status_macros.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/generated_enum_reflection.h"

namespace metricsql {

CompilerOptions::CompilerOptions() : enabled_rewrites_(DefaultRewrites()) {}

absl::btree_set<RewritePass> CompilerOptions::DefaultRewrites() {
  absl::btree_set<RewritePass> default_rewrites;
  const google::protobuf::EnumDescriptor* descriptor =
      google::protobuf::GetEnumDescriptor<RewritePass>();
  for (int i = 0; i < descriptor->value_count(); ++i) {
    const RewritePass rewrite =
        static_cast<RewritePass>(descriptor->value(i)->number());
    if (rewrite != REWRITE_INVALID_DO_NOT_USE) {
      default_rewrites.insert(rewrite);
    }
  }
  return default_rewrites;
}

void CompilerOptions::enable_rewrite(RewritePass rewrite, bool enable) {
  if (enable) {
    enabled_rewrites_.insert(rewrite);
  } else {
    enabled_rewrites_.erase(rewrite);
  }
}

absl::Status CompilerOptions::Validate() const {
  absl::TimeZone unused;
  if (!absl::LoadTimeZone(time_zone_, &unused)) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "Unknown time zone: " << time_zone_;
  }
  if (first_day_of_week_ < 1 || first_day_of_week_ > 7) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "first_day_of_week must be in [1, 7], got "
           << first_day_of_week_;
  }
  if (first_month_of_year_ < 1 || first_month_of_year_ > 12) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "first_month_of_year must be in [1, 12], got "
           << first_month_of_year_;
  }
  if (row_cap_.has_value() && *row_cap_ < 0) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "row_cap must be non-negative, got " << *row_cap_;
  }
  return absl::OkStatus();
}

absl::Status CompilerOptions::Serialize(CompilerOptionsProto* proto) const {
  proto->Clear();
  if (row_cap_.has_value()) {
    proto->set_row_cap(*row_cap_);
  }
  proto->set_allow_approximate_comparisons(allow_approximate_comparisons_);
  for (RewritePass rewrite : enabled_rewrites_) {
    proto->add_enabled_rewrites(rewrite);
  }
  if (execution_time_.has_value()) {
    proto->set_execution_time_micros(absl::ToUnixMicros(*execution_time_));
  }
  proto->set_time_zone(time_zone_);
  proto->set_first_day_of_week(first_day_of_week_);
  proto->set_first_month_of_year(first_month_of_year_);
  return absl::OkStatus();
}

absl::Status CompilerOptions::Deserialize(const CompilerOptionsProto& proto,
                                          CompilerOptions* result) {
  *result = CompilerOptions();
  if (proto.has_row_cap()) {
    result->set_row_cap(proto.row_cap());
  }
  result->set_allow_approximate_comparisons(
      proto.allow_approximate_comparisons());
  if (proto.enabled_rewrites_size() > 0) {
    absl::btree_set<RewritePass> rewrites;
    for (int rewrite : proto.enabled_rewrites()) {
      rewrites.insert(static_cast<RewritePass>(rewrite));
    }
    result->set_enabled_rewrites(std::move(rewrites));
  }
  if (proto.has_execution_time_micros()) {
    result->set_execution_time(
        absl::FromUnixMicros(proto.execution_time_micros()));
  }
  result->set_time_zone(proto.time_zone());
  result->set_first_day_of_week(proto.first_day_of_week());
  result->set_first_month_of_year(proto.first_month_of_year());
  return result->Validate();
}

}  // namespace metricsql
