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

#include "metricsql/rewriters/approximate_comparison_join_rewriter.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "metricsql/base/logging.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/common/errors.h"
#include "metricsql/planner/plan_tree.h"
#include "metricsql/proto/options.pb.h"

namespace metricsql {

namespace {

class ApproximateComparisonJoinRewriter : public Rewriter {
 public:
  Stage stage() const override { return PLAN; }

  absl::Status RewritePlan(const RewriteContext& context, PlanTree* tree,
                           RewriteOutputProperties& properties) const override {
    METRICSQL_RET_CHECK(context.options != nullptr);
    METRICSQL_RET_CHECK(context.dialect != nullptr);
    if (!context.options->allow_approximate_comparisons() || tree->empty()) {
      return absl::OkStatus();
    }
    SelectBlock* root = tree->mutable_root();
    if (root->joins.size() != 1 ||
        root->joins[0].kind != JoinKind::kFullOuter) {
      return absl::OkStatus();
    }
    if (!context.dialect->SupportsApproximateComparisons()) {
      return MakeRewriteError(REWRITE_APPROXIMATE_COMPARISON_JOIN,
                              absl::StatusCode::kFailedPrecondition)
             << "Approximate comparisons are enabled but dialect "
             << context.dialect->Name() << " does not support them";
    }
    JoinChild& join = root->joins[0];

    std::string anchor_alias = root->from_alias;
    join.kind = JoinKind::kLeft;
    if (!root->order.empty()) {
      const FieldNode* primary = root->FindField(root->order[0].field);
      if (primary != nullptr && primary->source_alias == join.alias) {
        anchor_alias = join.alias;
        join.kind = JoinKind::kRight;
      }
    }
    METRICSQL_VLOG(3) << "Joining " << root->alias << " with "
                      << context.dialect->JoinKeyword(join.kind)
                      << ", anchored on " << anchor_alias;

    SelectBlock* anchor = tree->FindMutableBlock(anchor_alias);
    METRICSQL_RET_CHECK(anchor != nullptr) << "Unknown block " << anchor_alias;
    return PushDownOrderAndLimit(*root, anchor);
  }

  std::string Name() const override {
    return "ApproximateComparisonJoinRewriter";
  }

 private:
  // With a one-sided join every output row is one row of the anchor, so the
  // first rows of the anchor in root order are the first rows of the root.
  static absl::Status PushDownOrderAndLimit(const SelectBlock& root,
                                            SelectBlock* anchor) {
    if (!root.where.empty() || !root.having.empty() ||
        !root.limit.has_value() || root.order.empty() ||
        anchor->limit.has_value()) {
      return absl::OkStatus();
    }
    std::vector<OrderField> order;
    for (const OrderField& root_order : root.order) {
      const FieldNode* field = root.FindField(root_order.field);
      if (field == nullptr || field->source_alias != anchor->alias) {
        return absl::OkStatus();
      }
      METRICSQL_RET_CHECK(anchor->FindField(field->source_field) != nullptr)
          << "Block " << anchor->alias << " has no field "
          << field->source_field;
      OrderField pushed;
      pushed.field = field->source_field;
      pushed.desc = root_order.desc;
      order.push_back(std::move(pushed));
    }
    anchor->order = std::move(order);
    anchor->limit = *root.limit + root.offset.value_or(0);
    return absl::OkStatus();
  }
};

}  // namespace

const Rewriter* GetApproximateComparisonJoinRewriter() {
  static const Rewriter* rewriter = new ApproximateComparisonJoinRewriter();
  return rewriter;
}

}  // namespace metricsql
