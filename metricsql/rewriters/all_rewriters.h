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

#ifndef METRICSQL_REWRITERS_ALL_REWRITERS_H_
#define METRICSQL_REWRITERS_ALL_REWRITERS_H_

namespace metricsql {

// Registers the builtin rewriters with the RewriteRegistry. Safe to call
// more than once and from multiple threads.
void RegisterBuiltinRewriters();

}  // namespace metricsql

#endif  // METRICSQL_REWRITERS_ALL_REWRITERS_H_
