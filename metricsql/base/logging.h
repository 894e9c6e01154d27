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

#ifndef METRICSQL_BASE_LOGGING_H_
#define METRICSQL_BASE_LOGGING_H_

#include <ostream>
#include <sstream>
#include <string>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"
#include "absl/log/absl_check.h"
#include "absl/log/absl_log.h"

// A ABSL_LOG command with an associated verbosity level. The threshold is
// process-wide and set with set_vlog_level().
//
//   METRICSQL_VLOG(2) << "Running rewriter " << rewriter->Name();
#define METRICSQL_VLOG(level) \
  ABSL_LOG_IF(INFO, (level) <= ::metricsql_base::get_vlog_level())

#define METRICSQL_VLOG_IS_ON(level) \
  ((level) <= ::metricsql_base::get_vlog_level())

namespace metricsql_base {

// Formats "expr (v1 vs. v2)" for a failing METRICSQL_RET_CHECK_XX.
template <typename T1, typename T2>
std::string* MakeCheckOpString(const T1& v1, const T2& v2,
                               const char* exprtext) {
  std::ostringstream os;
  os << exprtext << " (" << v1 << " vs. " << v2 << ")";
  return new std::string(os.str());
}

// Returns nullptr when the comparison holds, otherwise a heap allocated
// message owned by the caller.
#define METRICSQL_DEFINE_CHECK_OP_IMPL(name, op)                          \
  template <typename T1, typename T2>                                     \
  inline std::string* name##Impl(const T1& v1, const T2& v2,              \
                                 const char* exprtext) {                  \
    if (v1 op v2) return nullptr;                                         \
    return ::metricsql_base::MakeCheckOpString(v1, v2, exprtext);         \
  }                                                                       \
  inline std::string* name##Impl(int v1, int v2, const char* exprtext) {  \
    return ::metricsql_base::name##Impl<int, int>(v1, v2, exprtext);      \
  }

METRICSQL_DEFINE_CHECK_OP_IMPL(Check_EQ, ==)
METRICSQL_DEFINE_CHECK_OP_IMPL(Check_NE, !=)
METRICSQL_DEFINE_CHECK_OP_IMPL(Check_LE, <=)
METRICSQL_DEFINE_CHECK_OP_IMPL(Check_LT, <)
METRICSQL_DEFINE_CHECK_OP_IMPL(Check_GE, >=)
METRICSQL_DEFINE_CHECK_OP_IMPL(Check_GT, >)
#undef METRICSQL_DEFINE_CHECK_OP_IMPL

template <typename T>
inline const T& GetReferenceableValue(const T& t) {
  return t;
}
inline int GetReferenceableValue(int t) { return t; }
inline long GetReferenceableValue(long t) { return t; }  // NOLINT
inline long long GetReferenceableValue(long long t) {    // NOLINT
  return t;
}

// Gets the verbosity threshold for METRICSQL_VLOG.
int get_vlog_level();

// Sets the verbosity threshold for METRICSQL_VLOG. Statements with a level
// equal to or lower than `level` are logged.
void set_vlog_level(int level);

}  // namespace metricsql_base

#endif  // METRICSQL_BASE_LOGGING_H_
