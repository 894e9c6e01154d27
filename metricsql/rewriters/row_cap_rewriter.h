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

#ifndef METRICSQL_REWRITERS_ROW_CAP_REWRITER_H_
#define METRICSQL_REWRITERS_ROW_CAP_REWRITER_H_

#include "metricsql/public/rewriter_interface.h"

namespace metricsql {

// Enforces the row cap C, taken from the options or else the dialect's
// default. With C = 0 nothing is done. A query without a limit gets limit
// C + 1, so that a result with more than C rows shows it was truncated; a
// query whose limit exceeds C is rejected with kOutOfRange. The cap in
// effect is recorded in the output properties.
const Rewriter* GetRowCapRewriter();

}  // namespace metricsql

#endif  // METRICSQL_REWRITERS_ROW_CAP_REWRITER_H_
