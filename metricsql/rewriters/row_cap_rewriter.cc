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

#include "metricsql/rewriters/row_cap_rewriter.h"

#include <cstdint>
#include <limits>
#include <string>

#include "absl/status/status.h"
#include "metricsql/base/logging.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/common/errors.h"
#include "metricsql/proto/options.pb.h"

namespace metricsql {

namespace {

class RowCapRewriter : public Rewriter {
 public:
  Stage stage() const override { return QUERY; }

  absl::Status RewriteQuery(const RewriteContext& context, Query* query,
                            RewriteOutputProperties& properties) const override {
    METRICSQL_RET_CHECK(context.options != nullptr);
    METRICSQL_RET_CHECK(context.dialect != nullptr);
    const int64_t cap = context.options->row_cap().value_or(
        context.dialect->DefaultRowCap());
    if (cap <= 0) {
      return absl::OkStatus();
    }
    if (!query->limit.has_value()) {
      // One extra row tells the caller the result was cut off. A cap at the
      // int64 maximum cannot be exceeded.
      if (cap < std::numeric_limits<int64_t>::max()) {
        query->limit = cap + 1;
      } else {
        query->limit = cap;
      }
      METRICSQL_VLOG(3) << "Limiting query to " << *query->limit << " rows";
    } else if (*query->limit > cap) {
      return MakeRewriteError(REWRITE_ROW_CAP, absl::StatusCode::kOutOfRange)
             << "Limit " << *query->limit << " exceeds the row cap of " << cap;
    }
    properties.row_cap = cap;
    return absl::OkStatus();
  }

  std::string Name() const override { return "RowCapRewriter"; }
};

}  // namespace

const Rewriter* GetRowCapRewriter() {
  static const Rewriter* rewriter = new RowCapRewriter();
  return rewriter;
}

}  // namespace metricsql
