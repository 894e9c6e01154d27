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

#ifndef METRICSQL_BASE_STATUS_BUILDER_H_
#define METRICSQL_BASE_STATUS_BUILDER_H_

#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "metricsql/base/source_location.h"
#include "metricsql/base/status_payload.h"

namespace metricsql_base {

// Creates a status based on an original_status, but enriched with additional
// information. The builder implicitly converts to Status and StatusOr<T>
// allowing for it to be returned directly.
//
//   return StatusBuilder(original, METRICSQL_LOC).Attach(info)
//          << "while resolving measure " << name;
//
// - When the original status is OK, all methods become no-ops.
// - Streamed messages are joined to the original message with "; " unless
//   SetAppend() or SetPrepend() was called.
// - Logging (see Log()) happens when the builder is converted to a status.
class ABSL_MUST_USE_RESULT StatusBuilder {
 public:
  StatusBuilder(absl::StatusCode code, metricsql_base::SourceLocation location =
                                           SourceLocation::current());
  StatusBuilder(
      const absl::Status& original_status,
      metricsql_base::SourceLocation location = SourceLocation::current());
  StatusBuilder(
      absl::Status&& original_status,
      metricsql_base::SourceLocation location = SourceLocation::current());

  StatusBuilder(const StatusBuilder& sb);
  StatusBuilder& operator=(const StatusBuilder& sb);
  StatusBuilder(StatusBuilder&&) = default;
  StatusBuilder& operator=(StatusBuilder&&) = default;

  // Streamed text is placed before the original message, without separator.
  StatusBuilder& SetPrepend();

  // Streamed text is placed after the original message, without separator.
  StatusBuilder& SetAppend();

  // Logs the resulting status at `level` when converted.
  StatusBuilder& Log(absl::LogSeverity level);
  StatusBuilder& LogError() { return Log(absl::LogSeverity::kError); }
  StatusBuilder& LogWarning() { return Log(absl::LogSeverity::kWarning); }

  template <typename T>
  StatusBuilder& operator<<(const T& value);

  // Attaches a proto payload, replacing any payload of the same type.
  template <typename T>
  StatusBuilder& Attach(const T& data);

  bool ok() const { return status_.ok(); }
  absl::StatusCode code() const { return status_.code(); }

  operator absl::Status() const&;  // NOLINT
  operator absl::Status() &&;      // NOLINT

  template <typename T>
  operator absl::StatusOr<T>() const&;  // NOLINT
  template <typename T>
  operator absl::StatusOr<T>() &&;  // NOLINT

  metricsql_base::SourceLocation source_location() const { return location_; }

 private:
  enum class MessageJoinStyle {
    kAnnotate,
    kAppend,
    kPrepend,
  };

  static absl::Status JoinMessageToStatus(absl::Status s, absl::string_view msg,
                                          MessageJoinStyle style);

  absl::Status CreateStatusAndConditionallyLog() &&;

  struct Rep {
    Rep() = default;
    Rep(const Rep& r);

    bool should_log = false;
    absl::LogSeverity log_severity = absl::LogSeverity::kInfo;
    std::ostringstream stream;
    MessageJoinStyle message_join_style = MessageJoinStyle::kAnnotate;
  };

  absl::Status status_;
  metricsql_base::SourceLocation location_;

  // Allocated lazily, only when the status is not OK and something was
  // streamed or configured.
  std::unique_ptr<Rep> rep_;
};

StatusBuilder CancelledErrorBuilder(
    metricsql_base::SourceLocation location = SourceLocation::current());
StatusBuilder FailedPreconditionErrorBuilder(
    metricsql_base::SourceLocation location = SourceLocation::current());
StatusBuilder InternalErrorBuilder(
    metricsql_base::SourceLocation location = SourceLocation::current());
StatusBuilder InvalidArgumentErrorBuilder(
    metricsql_base::SourceLocation location = SourceLocation::current());
StatusBuilder NotFoundErrorBuilder(
    metricsql_base::SourceLocation location = SourceLocation::current());
StatusBuilder OutOfRangeErrorBuilder(
    metricsql_base::SourceLocation location = SourceLocation::current());
StatusBuilder PermissionDeniedErrorBuilder(
    metricsql_base::SourceLocation location = SourceLocation::current());
StatusBuilder UnimplementedErrorBuilder(
    metricsql_base::SourceLocation location = SourceLocation::current());

inline StatusBuilder::StatusBuilder(absl::StatusCode code,
                                    metricsql_base::SourceLocation location)
    : status_(code, ""), location_(location) {}

inline StatusBuilder::StatusBuilder(const absl::Status& original_status,
                                    metricsql_base::SourceLocation location)
    : status_(original_status), location_(location) {}

inline StatusBuilder::StatusBuilder(absl::Status&& original_status,
                                    metricsql_base::SourceLocation location)
    : status_(std::move(original_status)), location_(location) {}

inline StatusBuilder::StatusBuilder(const StatusBuilder& sb)
    : status_(sb.status_), location_(sb.location_) {
  if (sb.rep_ != nullptr) {
    rep_ = std::make_unique<Rep>(*sb.rep_);
  }
}

inline StatusBuilder& StatusBuilder::operator=(const StatusBuilder& sb) {
  status_ = sb.status_;
  location_ = sb.location_;
  if (sb.rep_ != nullptr) {
    rep_ = std::make_unique<Rep>(*sb.rep_);
  } else {
    rep_ = nullptr;
  }
  return *this;
}

inline StatusBuilder& StatusBuilder::SetPrepend() {
  if (status_.ok()) return *this;
  if (rep_ == nullptr) rep_ = std::make_unique<Rep>();
  rep_->message_join_style = MessageJoinStyle::kPrepend;
  return *this;
}

inline StatusBuilder& StatusBuilder::SetAppend() {
  if (status_.ok()) return *this;
  if (rep_ == nullptr) rep_ = std::make_unique<Rep>();
  rep_->message_join_style = MessageJoinStyle::kAppend;
  return *this;
}

inline StatusBuilder& StatusBuilder::Log(absl::LogSeverity level) {
  if (status_.ok()) return *this;
  if (rep_ == nullptr) rep_ = std::make_unique<Rep>();
  rep_->should_log = true;
  rep_->log_severity = level;
  return *this;
}

template <typename T>
StatusBuilder& StatusBuilder::operator<<(const T& value) {
  if (status_.ok()) return *this;
  if (rep_ == nullptr) rep_ = std::make_unique<Rep>();
  rep_->stream << value;
  return *this;
}

template <typename T>
StatusBuilder& StatusBuilder::Attach(const T& data) {
  if (status_.ok()) return *this;
  AttachPayload<T>(&status_, data);
  return *this;
}

inline StatusBuilder::operator absl::Status() const& {
  if (rep_ == nullptr) return status_;
  return StatusBuilder(*this).CreateStatusAndConditionallyLog();
}

inline StatusBuilder::operator absl::Status() && {
  if (rep_ == nullptr) return std::move(status_);
  return std::move(*this).CreateStatusAndConditionallyLog();
}

template <typename T>
inline StatusBuilder::operator absl::StatusOr<T>() const& {
  if (rep_ == nullptr) return absl::StatusOr<T>(status_);
  return absl::StatusOr<T>(
      StatusBuilder(*this).CreateStatusAndConditionallyLog());
}

template <typename T>
inline StatusBuilder::operator absl::StatusOr<T>() && {
  if (rep_ == nullptr) return absl::StatusOr<T>(std::move(status_));
  return absl::StatusOr<T>(std::move(*this).CreateStatusAndConditionallyLog());
}

inline std::ostream& operator<<(std::ostream& os,
                                const StatusBuilder& builder) {
  return os << static_cast<absl::Status>(builder);
}

}  // namespace metricsql_base

#endif  // METRICSQL_BASE_STATUS_BUILDER_H_
