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

#include "metricsql/public/executor.h"

#include "metricsql/base/status_builder.h"

namespace metricsql {

absl::Status ExecutionContext::CheckAlive(absl::Time now) const {
  if (is_cancelled_ && is_cancelled_()) {
    return ::metricsql_base::CancelledErrorBuilder()
           << "Compilation was cancelled";
  }
  if (now >= deadline_) {
    return absl::DeadlineExceededError("Compilation deadline exceeded");
  }
  return absl::OkStatus();
}

}  // namespace metricsql
