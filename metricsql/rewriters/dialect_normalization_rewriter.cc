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

#include "metricsql/rewriters/dialect_normalization_rewriter.h"

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "metricsql/base/logging.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/planner/plan_tree.h"

namespace metricsql {

namespace {

class DialectNormalizationRewriter : public Rewriter {
 public:
  Stage stage() const override { return PLAN; }

  absl::Status RewritePlan(const RewriteContext& context, PlanTree* tree,
                           RewriteOutputProperties& properties) const override {
    METRICSQL_RET_CHECK(context.dialect != nullptr);
    const Dialect& dialect = *context.dialect;
    if (!dialect.RequiresGroupingForJoins()) {
      return absl::OkStatus();
    }
    for (SelectBlock* block : tree->mutable_blocks()) {
      if (block->joins.empty() || block->grouped) continue;
      METRICSQL_RET_CHECK(!block->select_star)
          << "Block " << block->alias << " selects * over a join";
      block->grouped = true;
      for (FieldNode& measure : block->measures) {
        // Arguments keep their order; only text is added around them.
        measure.expr = SqlFragment(dialect.FirstValueAggregate(measure.expr.sql),
                                   std::move(measure.expr.args));
        measure.source_alias.clear();
        measure.source_field.clear();
      }
      METRICSQL_VLOG(3) << "Grouped block " << block->alias << " for "
                        << dialect.Name();
    }
    return absl::OkStatus();
  }

  std::string Name() const override { return "DialectNormalizationRewriter"; }
};

}  // namespace

const Rewriter* GetDialectNormalizationRewriter() {
  static const Rewriter* rewriter = new DialectNormalizationRewriter();
  return rewriter;
}

}  // namespace metricsql
