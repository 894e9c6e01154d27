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

#ifndef METRICSQL_COMMON_ERRORS_H_
#define METRICSQL_COMMON_ERRORS_H_

// Error status factories for the compiler. Each returns a
// metricsql_base::StatusBuilder carrying a CompileErrorInfo payload, so the
// message can be built with << and the error kind survives propagation:
//
//   return MakeValidationError("sort[0]")
//          << "sort field " << name << " is not a requested dimension";
//
//   return MakeRewriteError(REWRITE_ROW_CAP, absl::StatusCode::kOutOfRange)
//          << "limit " << limit << " exceeds the row cap " << cap;
//
// Status codes used:
//   VALIDATION           kInvalidArgument, kPermissionDenied
//   REWRITE              pass specific (kInvalidArgument, kOutOfRange, or the
//                        code reported by the query executor)
//   UNSUPPORTED_FEATURE  kUnimplemented
//   COMPILE_INVARIANT    kInternal. METRICSQL_RET_CHECK failures carry no
//                        payload and are classified here as well.

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "metricsql/base/source_location.h"
#include "metricsql/base/status_builder.h"
#include "metricsql/proto/compile_error.pb.h"
#include "metricsql/proto/options.pb.h"

namespace metricsql {

// A malformed query, naming the offending `field`.
::metricsql_base::StatusBuilder MakeValidationError(
    absl::string_view field, ::metricsql_base::SourceLocation location =
                                 ::metricsql_base::SourceLocation::current());

// A dimension or measure the security policy hides from the caller.
::metricsql_base::StatusBuilder MakeAccessDeniedError(
    absl::string_view field, ::metricsql_base::SourceLocation location =
                                 ::metricsql_base::SourceLocation::current());

// A failure inside rewrite pass `pass`.
::metricsql_base::StatusBuilder MakeRewriteError(
    RewritePass pass, absl::StatusCode code = absl::StatusCode::kInvalidArgument,
    ::metricsql_base::SourceLocation location =
        ::metricsql_base::SourceLocation::current());

// A construct with no generator for the active dialect.
::metricsql_base::StatusBuilder MakeUnsupportedFeatureError(
    ::metricsql_base::SourceLocation location =
        ::metricsql_base::SourceLocation::current());

// A broken internal invariant.
::metricsql_base::StatusBuilder MakeCompileInvariantError(
    ::metricsql_base::SourceLocation location =
        ::metricsql_base::SourceLocation::current());

// Tags a non-OK `status` returned from inside rewrite pass `pass` with that
// pass. Statuses already classified as UNSUPPORTED_FEATURE or
// COMPILE_INVARIANT keep their kind; everything else becomes REWRITE. The
// status code and message are preserved. OK statuses are returned unchanged.
absl::Status AnnotateRewriteError(absl::Status status, RewritePass pass);

// Classifies `status`. Returns COMPILE_ERROR_KIND_UNSPECIFIED for OK statuses
// and for errors the compiler did not produce.
CompileErrorKind GetCompileErrorKind(const absl::Status& status);

// "VALIDATION", "REWRITE", ... for logs.
std::string CompileErrorKindName(CompileErrorKind kind);

// The rewrite pass recorded on `status`, if any.
std::optional<RewritePass> GetRewritePass(const absl::Status& status);

// The query field recorded on `status`; empty if none.
std::string GetErrorField(const absl::Status& status);

}  // namespace metricsql

#endif  // METRICSQL_COMMON_ERRORS_H_
