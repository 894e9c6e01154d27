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

#ifndef METRICSQL_REWRITERS_REGISTRATION_H_
#define METRICSQL_REWRITERS_REGISTRATION_H_

#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "metricsql/proto/options.pb.h"
#include "metricsql/public/rewriter_interface.h"

namespace metricsql {

// The process-wide table of rewrite passes, keyed by RewritePass. Passes
// run in the order they were registered. Populated once by
// RegisterBuiltinRewriters(); reads are safe from any thread afterwards.
class RewriteRegistry {
 public:
  RewriteRegistry() = default;
  RewriteRegistry(const RewriteRegistry&) = delete;
  RewriteRegistry& operator=(const RewriteRegistry&) = delete;

  static RewriteRegistry& global_instance();

  // Returns nullptr if no rewriter is registered for `key`.
  const Rewriter* Get(RewritePass key) const;

  // Registers `rewriter`, which must stay alive for the life of the process,
  // under `key`. Check-fails if `key` is already registered.
  void Register(RewritePass key, const Rewriter* rewriter);

  // The registered keys in registration order.
  std::vector<RewritePass> registration_order() const;

 private:
  mutable absl::Mutex mu_;
  absl::flat_hash_map<RewritePass, const Rewriter*> rewriters_
      ABSL_GUARDED_BY(mu_);
  std::vector<RewritePass> registration_order_ ABSL_GUARDED_BY(mu_);
};

}  // namespace metricsql

#endif  // METRICSQL_REWRITERS_REGISTRATION_H_
