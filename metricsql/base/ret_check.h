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

#ifndef METRICSQL_BASE_RET_CHECK_H_
#define METRICSQL_BASE_RET_CHECK_H_

// Macros for non-fatal assertions. Instead of aborting the process on
// failure, these return an absl::Status with code kInternal from the current
// method, carrying a CompileErrorInfo payload of kind COMPILE_INVARIANT.
//
//   METRICSQL_RET_CHECK(block != nullptr);
//   METRICSQL_RET_CHECK_EQ(lhs.size(), rhs.size()) << "while joining";
//   METRICSQL_RET_CHECK_FAIL() << "Unknown operator";
//
// Can only be used in functions that return absl::Status or absl::StatusOr.

#include <string>

#include "absl/status/status.h"
#include "metricsql/base/logging.h"
#include "metricsql/base/source_location.h"
#include "metricsql/base/status_builder.h"
#include "metricsql/base/status_macros.h"

namespace metricsql_base {
namespace internal_ret_check {

StatusBuilder RetCheckFailSlowPath(SourceLocation location);
StatusBuilder RetCheckFailSlowPath(SourceLocation location,
                                   const char* condition);
StatusBuilder RetCheckFailSlowPath(SourceLocation location,
                                   const char* condition,
                                   const absl::Status& s);

// Takes ownership of `condition`.
StatusBuilder RetCheckFailSlowPath(SourceLocation location,
                                   std::string* condition);

inline StatusBuilder RetCheckImpl(const absl::Status& status,
                                  const char* condition,
                                  SourceLocation location) {
  if (ABSL_PREDICT_TRUE(status.ok()))
    return StatusBuilder(absl::OkStatus(), location);
  return RetCheckFailSlowPath(location, condition, status);
}

}  // namespace internal_ret_check
}  // namespace metricsql_base

#define METRICSQL_RET_CHECK(cond)                                 \
  while (ABSL_PREDICT_FALSE(!(cond)))                             \
  return ::metricsql_base::internal_ret_check::RetCheckFailSlowPath( \
      METRICSQL_LOC, #cond)

#define METRICSQL_RET_CHECK_FAIL()                                \
  return ::metricsql_base::internal_ret_check::RetCheckFailSlowPath( \
      METRICSQL_LOC)

// Asserts that `status` is ok; otherwise returns an internal error wrapping
// its text.
#define METRICSQL_RET_CHECK_OK(status)                                        \
  METRICSQL_RETURN_IF_ERROR(::metricsql_base::internal_ret_check::RetCheckImpl( \
      (status), #status, METRICSQL_LOC))

#define METRICSQL_STATUS_MACROS_INTERNAL_RET_CHECK_OP(name, op, lhs, rhs) \
  while (std::string* _result = ::metricsql_base::Check_##name##Impl(     \
             ::metricsql_base::GetReferenceableValue(lhs),                \
             ::metricsql_base::GetReferenceableValue(rhs),                \
             #lhs " " #op " " #rhs))                                      \
  return ::metricsql_base::internal_ret_check::RetCheckFailSlowPath(      \
      METRICSQL_LOC, _result)

#define METRICSQL_RET_CHECK_EQ(lhs, rhs) \
  METRICSQL_STATUS_MACROS_INTERNAL_RET_CHECK_OP(EQ, ==, lhs, rhs)
#define METRICSQL_RET_CHECK_NE(lhs, rhs) \
  METRICSQL_STATUS_MACROS_INTERNAL_RET_CHECK_OP(NE, !=, lhs, rhs)
#define METRICSQL_RET_CHECK_LE(lhs, rhs) \
  METRICSQL_STATUS_MACROS_INTERNAL_RET_CHECK_OP(LE, <=, lhs, rhs)
#define METRICSQL_RET_CHECK_LT(lhs, rhs) \
  METRICSQL_STATUS_MACROS_INTERNAL_RET_CHECK_OP(LT, <, lhs, rhs)
#define METRICSQL_RET_CHECK_GE(lhs, rhs) \
  METRICSQL_STATUS_MACROS_INTERNAL_RET_CHECK_OP(GE, >=, lhs, rhs)
#define METRICSQL_RET_CHECK_GT(lhs, rhs) \
  METRICSQL_STATUS_MACROS_INTERNAL_RET_CHECK_OP(GT, >, lhs, rhs)

#endif  // METRICSQL_BASE_RET_CHECK_H_
