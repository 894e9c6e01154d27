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

#ifndef METRICSQL_REWRITERS_DIALECT_NORMALIZATION_REWRITER_H_
#define METRICSQL_REWRITERS_DIALECT_NORMALIZATION_REWRITER_H_

#include "metricsql/public/rewriter_interface.h"

namespace metricsql {

// For dialects that RequiresGroupingForJoins(), makes every block with join
// children a grouped block whose measures are wrapped in the dialect's
// FirstValueAggregate(). Blocks that are already grouped are left alone.
const Rewriter* GetDialectNormalizationRewriter();

}  // namespace metricsql

#endif  // METRICSQL_REWRITERS_DIALECT_NORMALIZATION_REWRITER_H_
