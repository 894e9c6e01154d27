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

#ifndef METRICSQL_PUBLIC_COMPILER_H_
#define METRICSQL_PUBLIC_COMPILER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "metricsql/public/compiler_options.h"
#include "metricsql/public/dialect.h"
#include "metricsql/public/executor.h"
#include "metricsql/public/metrics_view.h"
#include "metricsql/public/query.h"
#include "metricsql/public/security_policy.h"
#include "metricsql/public/value.h"

namespace metricsql {

// The output of a successful compilation: one SQL statement with '?'
// placeholders and the values bound to them, in order.
struct CompiledQuery {
  std::string sql;
  std::vector<Value> args;
  // The row cap in effect; 0 when none. The statement asks for one row more
  // than the cap so that truncation can be detected.
  int64_t row_cap = 0;

  // Whether a result of `row_count` rows was cut off by the row cap.
  bool IsTruncated(int64_t row_count) const {
    return row_cap > 0 && row_count > row_cap;
  }
};

// Compiles `query` against `view` into SQL for `dialect`:
//
//   validation -> query rewriters -> plan building -> plan rewriters -> SQL
//
// Either a complete statement is returned or an error, classified by
// GetCompileErrorKind(), and nothing may be executed.
//
// `security_policy` may be null for unrestricted access. `executor` may be
// null when no percent-of-total measure is requested; it is only called from
// this thread, before Compile() returns. `query` is not modified.
//
// Thread safety: any number of compilations may run concurrently against the
// same view and dialect.
absl::StatusOr<CompiledQuery> Compile(const Query& query,
                                      const MetricsView& view,
                                      const SecurityPolicy* security_policy,
                                      const Dialect& dialect,
                                      const CompilerOptions& options,
                                      const ExecutionContext& context,
                                      QueryExecutor* executor);

// As above, with a dialect looked up by name in the DialectRegistry after
// the builtin dialects are registered.
absl::StatusOr<CompiledQuery> Compile(const Query& query,
                                      const MetricsView& view,
                                      const SecurityPolicy* security_policy,
                                      absl::string_view dialect_name,
                                      const CompilerOptions& options,
                                      const ExecutionContext& context,
                                      QueryExecutor* executor);

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_COMPILER_H_
