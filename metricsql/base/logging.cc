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

#include "metricsql/base/logging.h"

#include <atomic>

#include "absl/base/attributes.h"

namespace metricsql_base {

namespace {

// Only METRICSQL_VLOG statements with level equal to or below this are logged.
ABSL_CONST_INIT std::atomic<int> vlog_level{0};

}  // namespace

int get_vlog_level() { return vlog_level.load(std::memory_order_relaxed); }

void set_vlog_level(int level) {
  vlog_level.store(level, std::memory_order_relaxed);
}

}  // namespace metricsql_base
