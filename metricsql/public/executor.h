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

#ifndef METRICSQL_PUBLIC_EXECUTOR_H_
#define METRICSQL_PUBLIC_EXECUTOR_H_

#include <functional>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "metricsql/public/query.h"
#include "metricsql/public/value.h"

namespace metricsql {

// The cancellation and deadline signal of the request a compilation runs
// for. Propagated into every call made to a QueryExecutor.
class ExecutionContext {
 public:
  ExecutionContext() = default;

  absl::Time deadline() const { return deadline_; }
  void set_deadline(absl::Time deadline) { deadline_ = deadline; }

  // `is_cancelled` is polled; it must be safe to call from the compiling
  // thread.
  void set_cancellation_callback(std::function<bool()> is_cancelled) {
    is_cancelled_ = std::move(is_cancelled);
  }

  // Returns kCancelled if the request was cancelled and kDeadlineExceeded if
  // `now` is past the deadline; OK otherwise.
  absl::Status CheckAlive(absl::Time now = absl::Now()) const;

 private:
  absl::Time deadline_ = absl::InfiniteFuture();
  std::function<bool()> is_cancelled_;
};

// Runs queries on behalf of the compiler. Only the percent-of-total rewrite
// uses it, to obtain a grand total before the main query is built.
// Implementations compile `query` themselves (typically through Compile())
// and own retries, priorities and connection handling.
class QueryExecutor {
 public:
  virtual ~QueryExecutor() = default;

  // Runs `query`, which has exactly one measure and no dimensions, and
  // returns its single value. The value is NULL when no rows match.
  // Must honor `context` and return kCancelled or kDeadlineExceeded when it
  // fires.
  virtual absl::StatusOr<Value> ExecuteScalar(
      const Query& query, const ExecutionContext& context) = 0;
};

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_EXECUTOR_H_
