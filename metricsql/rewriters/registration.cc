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

#include "metricsql/rewriters/registration.h"

#include <vector>

#include "absl/log/absl_check.h"
#include "absl/synchronization/mutex.h"

namespace metricsql {

RewriteRegistry& RewriteRegistry::global_instance() {
  static RewriteRegistry* registry = new RewriteRegistry();
  return *registry;
}

const Rewriter* RewriteRegistry::Get(RewritePass key) const {
  absl::MutexLock lock(&mu_);
  auto it = rewriters_.find(key);
  if (it == rewriters_.end()) {
    return nullptr;
  }
  return it->second;
}

void RewriteRegistry::Register(RewritePass key, const Rewriter* rewriter) {
  absl::MutexLock lock(&mu_);
  ABSL_CHECK(rewriter != nullptr) << RewritePass_Name(key);
  ABSL_CHECK(rewriters_.emplace(key, rewriter).second)
      << "Key already registered: " << RewritePass_Name(key);
  registration_order_.push_back(key);
}

std::vector<RewritePass> RewriteRegistry::registration_order() const {
  absl::MutexLock lock(&mu_);
  return registration_order_;
}

}  // namespace metricsql
