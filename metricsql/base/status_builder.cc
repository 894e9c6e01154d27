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

#include "metricsql/base/status_builder.h"

#include <string>
#include <utility>

#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "metricsql/base/logging.h"

namespace metricsql_base {

const absl::string_view kMetricSqlTypeUrlPrefix =
    "type.googleapis.com/";

StatusBuilder::Rep::Rep(const Rep& r)
    : should_log(r.should_log),
      log_severity(r.log_severity),
      stream(r.stream.str()),
      message_join_style(r.message_join_style) {
  stream.seekp(0, std::ios_base::end);
}

absl::Status StatusBuilder::JoinMessageToStatus(absl::Status s,
                                                absl::string_view msg,
                                                MessageJoinStyle style) {
  if (msg.empty()) return s;

  std::string new_msg;
  if (s.message().empty()) {
    new_msg = std::string(msg);
  } else {
    switch (style) {
      case MessageJoinStyle::kAnnotate:
        new_msg = absl::StrCat(s.message(), "; ", msg);
        break;
      case MessageJoinStyle::kAppend:
        new_msg = absl::StrCat(s.message(), msg);
        break;
      case MessageJoinStyle::kPrepend:
        new_msg = absl::StrCat(msg, s.message());
        break;
    }
  }
  absl::Status result(s.code(), new_msg);
  s.ForEachPayload([&result](absl::string_view type_url,
                             const absl::Cord& payload) {
    result.SetPayload(type_url, payload);
  });
  return result;
}

absl::Status StatusBuilder::CreateStatusAndConditionallyLog() && {
  absl::Status result = JoinMessageToStatus(
      std::move(status_), rep_->stream.str(), rep_->message_join_style);
  if (rep_->should_log) {
    ABSL_LOG(LEVEL(rep_->log_severity))
            .AtLocation(location_.file_name(), location_.line())
        << result;
  }
  // We release the rep here to avoid repeated logging if the builder is
  // converted more than once.
  rep_ = nullptr;
  return result;
}

StatusBuilder CancelledErrorBuilder(metricsql_base::SourceLocation location) {
  return StatusBuilder(absl::StatusCode::kCancelled, location);
}

StatusBuilder FailedPreconditionErrorBuilder(
    metricsql_base::SourceLocation location) {
  return StatusBuilder(absl::StatusCode::kFailedPrecondition, location);
}

StatusBuilder InternalErrorBuilder(metricsql_base::SourceLocation location) {
  return StatusBuilder(absl::StatusCode::kInternal, location);
}

StatusBuilder InvalidArgumentErrorBuilder(
    metricsql_base::SourceLocation location) {
  return StatusBuilder(absl::StatusCode::kInvalidArgument, location);
}

StatusBuilder NotFoundErrorBuilder(metricsql_base::SourceLocation location) {
  return StatusBuilder(absl::StatusCode::kNotFound, location);
}

StatusBuilder OutOfRangeErrorBuilder(metricsql_base::SourceLocation location) {
  return StatusBuilder(absl::StatusCode::kOutOfRange, location);
}

StatusBuilder PermissionDeniedErrorBuilder(
    metricsql_base::SourceLocation location) {
  return StatusBuilder(absl::StatusCode::kPermissionDenied, location);
}

StatusBuilder UnimplementedErrorBuilder(
    metricsql_base::SourceLocation location) {
  return StatusBuilder(absl::StatusCode::kUnimplemented, location);
}

}  // namespace metricsql_base
