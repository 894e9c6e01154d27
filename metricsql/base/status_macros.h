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

#ifndef METRICSQL_BASE_STATUS_MACROS_H_
#define METRICSQL_BASE_STATUS_MACROS_H_

// Helper macros to return and propagate errors with `absl::Status`.

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "metricsql/base/status_builder.h"

// Evaluates an expression that produces a `absl::Status`. If the status
// is not ok, returns it from the current function.
//
//   absl::Status MultiStepFunction() {
//     METRICSQL_RETURN_IF_ERROR(Function(args...));
//     METRICSQL_RETURN_IF_ERROR(foo.Method(args...)) << "in MultiStepFunction";
//     return absl::OkStatus();
//   }
//
// The macro ends with a `metricsql_base::StatusBuilder`, so streamed text is
// only evaluated on error. Inside a lambda, annotate the return type as
// `-> absl::Status`.
#define METRICSQL_RETURN_IF_ERROR(expr)                               \
  METRICSQL_STATUS_MACROS_IMPL_ELSE_BLOCKER_                          \
  if (::metricsql_base::status_macro_internal::StatusAdaptorForMacros \
          status_macro_internal_adaptor = {(expr), METRICSQL_LOC}) {  \
  } else /* NOLINT */                                                 \
    return status_macro_internal_adaptor.Consume()

// Executes an expression `rexpr` that returns a `absl::StatusOr<T>`. On OK,
// extracts its value into `lhs`, otherwise returns from the current function.
// An optional third argument may rewrite the error through the builder `_`:
//
//   METRICSQL_ASSIGN_OR_RETURN(Query query, Rewrite(query),
//                              _ << "while resolving time range");
//
// WARNING: expands into multiple statements; it cannot be used in a single
// statement (e.g. as the body of an if statement without {})!
#define METRICSQL_ASSIGN_OR_RETURN(...)                              \
  METRICSQL_STATUS_MACROS_IMPL_GET_VARIADIC_(                        \
      __VA_ARGS__, METRICSQL_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_, \
      METRICSQL_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_2_)              \
  (__VA_ARGS__)

// =================================================================
// == Implementation details, do not rely on anything below here. ==
// =================================================================

#define METRICSQL_STATUS_MACROS_IMPL_GET_VARIADIC_(_1, _2, _3, NAME, ...) NAME

#define METRICSQL_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_2_(lhs, rexpr) \
  METRICSQL_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_(lhs, rexpr, std::move(_))
#define METRICSQL_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_3_(lhs, rexpr,         \
                                                         error_expression)   \
  METRICSQL_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(                            \
      METRICSQL_STATUS_MACROS_IMPL_CONCAT_(_status_or_value, __LINE__), lhs, \
      rexpr, error_expression)
#define METRICSQL_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(statusor, lhs, rexpr, \
                                                       error_expression)     \
  auto statusor = (rexpr);                                                   \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                                  \
    ::metricsql_base::StatusBuilder _(std::move(statusor).status(),          \
                                      METRICSQL_LOC);                        \
    (void)_; /* error_expression is allowed to not use this variable */      \
    return (error_expression);                                               \
  }                                                                          \
  lhs = std::move(statusor).value()

#define METRICSQL_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define METRICSQL_STATUS_MACROS_IMPL_CONCAT_(x, y) \
  METRICSQL_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y)

// The "switch (0) case 0:" idiom keeps a dangling else from binding to an
// enclosing if.
#define METRICSQL_STATUS_MACROS_IMPL_ELSE_BLOCKER_ \
  switch (0)                                       \
  case 0:                                          \
  default:  // NOLINT

namespace metricsql_base {
namespace status_macro_internal {

// Provides a conversion to bool so that it can be used inside an if statement
// that declares a variable.
class StatusAdaptorForMacros {
 public:
  StatusAdaptorForMacros(const absl::Status& status, SourceLocation loc)
      : builder_(status, loc) {}

  StatusAdaptorForMacros(absl::Status&& status, SourceLocation loc)
      : builder_(std::move(status), loc) {}

  StatusAdaptorForMacros(const StatusBuilder& builder, SourceLocation loc)
      : builder_(builder) {}

  StatusAdaptorForMacros(StatusBuilder&& builder, SourceLocation loc)
      : builder_(std::move(builder)) {}

  StatusAdaptorForMacros(const StatusAdaptorForMacros&) = delete;
  StatusAdaptorForMacros& operator=(const StatusAdaptorForMacros&) = delete;

  explicit operator bool() const { return ABSL_PREDICT_TRUE(builder_.ok()); }

  metricsql_base::StatusBuilder&& Consume() { return std::move(builder_); }

 private:
  metricsql_base::StatusBuilder builder_;
};

}  // namespace status_macro_internal
}  // namespace metricsql_base

#endif  // METRICSQL_BASE_STATUS_MACROS_H_
