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

#include "metricsql/common/errors.h"

#include <optional>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "metricsql/base/status_builder.h"
#include "metricsql/base/status_payload.h"

namespace metricsql {

namespace {

CompileErrorInfo MakeInfo(CompileErrorKind kind, absl::string_view field) {
  CompileErrorInfo info;
  info.set_kind(kind);
  if (!field.empty()) {
    info.set_field(std::string(field));
  }
  return info;
}

}  // namespace

::metricsql_base::StatusBuilder MakeValidationError(
    absl::string_view field, ::metricsql_base::SourceLocation location) {
  return ::metricsql_base::InvalidArgumentErrorBuilder(location).Attach(
      MakeInfo(VALIDATION, field));
}

::metricsql_base::StatusBuilder MakeAccessDeniedError(
    absl::string_view field, ::metricsql_base::SourceLocation location) {
  return ::metricsql_base::PermissionDeniedErrorBuilder(location).Attach(
      MakeInfo(VALIDATION, field));
}

::metricsql_base::StatusBuilder MakeRewriteError(
    RewritePass pass, absl::StatusCode code,
    ::metricsql_base::SourceLocation location) {
  CompileErrorInfo info = MakeInfo(REWRITE, "");
  info.set_pass(pass);
  return ::metricsql_base::StatusBuilder(code, location).Attach(info);
}

::metricsql_base::StatusBuilder MakeUnsupportedFeatureError(
    ::metricsql_base::SourceLocation location) {
  return ::metricsql_base::UnimplementedErrorBuilder(location).Attach(
      MakeInfo(UNSUPPORTED_FEATURE, ""));
}

::metricsql_base::StatusBuilder MakeCompileInvariantError(
    ::metricsql_base::SourceLocation location) {
  return ::metricsql_base::InternalErrorBuilder(location)
      .Attach(MakeInfo(COMPILE_INVARIANT, ""))
      .LogError();
}

absl::Status AnnotateRewriteError(absl::Status status, RewritePass pass) {
  if (status.ok()) {
    return status;
  }
  CompileErrorInfo info =
      ::metricsql_base::GetPayload<CompileErrorInfo>(status);
  const CompileErrorKind kind = GetCompileErrorKind(status);
  if (kind != UNSUPPORTED_FEATURE && kind != COMPILE_INVARIANT) {
    info.set_kind(REWRITE);
  } else {
    info.set_kind(kind);
  }
  info.set_pass(pass);
  ::metricsql_base::AttachPayload(&status, info);
  return status;
}

CompileErrorKind GetCompileErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return COMPILE_ERROR_KIND_UNSPECIFIED;
  }
  if (::metricsql_base::HasPayloadWithType<CompileErrorInfo>(status)) {
    const CompileErrorInfo info =
        ::metricsql_base::GetPayload<CompileErrorInfo>(status);
    if (info.kind() != COMPILE_ERROR_KIND_UNSPECIFIED) {
      return info.kind();
    }
  }
  if (status.code() == absl::StatusCode::kInternal) {
    return COMPILE_INVARIANT;
  }
  return COMPILE_ERROR_KIND_UNSPECIFIED;
}

std::string CompileErrorKindName(CompileErrorKind kind) {
  return CompileErrorKind_Name(kind);
}

std::optional<RewritePass> GetRewritePass(const absl::Status& status) {
  const CompileErrorInfo info =
      ::metricsql_base::GetPayload<CompileErrorInfo>(status);
  if (!info.has_pass()) {
    return std::nullopt;
  }
  return info.pass();
}

std::string GetErrorField(const absl::Status& status) {
  return ::metricsql_base::GetPayload<CompileErrorInfo>(status).field();
}

}  // namespace metricsql
