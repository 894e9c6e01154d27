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

#include "metricsql/planner/plan_tree.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/base/status_macros.h"
#include "metricsql/common/errors.h"

namespace metricsql {

void SqlFragment::Append(const SqlFragment& other) {
  sql.append(other.sql);
  args.insert(args.end(), other.args.begin(), other.args.end());
}

const FieldNode* SelectBlock::FindField(absl::string_view name) const {
  for (const FieldNode& field : dimensions) {
    if (field.name == name) return &field;
  }
  for (const FieldNode& field : measures) {
    if (field.name == name) return &field;
  }
  return nullptr;
}

FieldNode* SelectBlock::FindMutableField(absl::string_view name) {
  return const_cast<FieldNode*>(
      static_cast<const SelectBlock*>(this)->FindField(name));
}

absl::StatusOr<SelectBlock*> PlanTree::AddBlock(absl::string_view alias) {
  METRICSQL_RET_CHECK(!alias.empty());
  if (blocks_by_alias_.contains(alias)) {
    return MakeCompileInvariantError()
           << "Duplicate select block alias: " << alias;
  }
  auto block = std::make_unique<SelectBlock>();
  block->alias = std::string(alias);
  SelectBlock* result = block.get();
  blocks_.push_back(std::move(block));
  blocks_by_alias_.emplace(std::string(alias), result);
  return result;
}

const SelectBlock* PlanTree::FindBlock(absl::string_view alias) const {
  auto it = blocks_by_alias_.find(alias);
  return it == blocks_by_alias_.end() ? nullptr : it->second;
}

SelectBlock* PlanTree::FindMutableBlock(absl::string_view alias) {
  auto it = blocks_by_alias_.find(alias);
  return it == blocks_by_alias_.end() ? nullptr : it->second;
}

std::vector<SelectBlock*> PlanTree::mutable_blocks() {
  std::vector<SelectBlock*> blocks;
  blocks.reserve(blocks_.size());
  for (const auto& block : blocks_) {
    blocks.push_back(block.get());
  }
  return blocks;
}

absl::Status PlanTree::Validate() const {
  METRICSQL_RET_CHECK(!blocks_.empty()) << "Plan tree has no blocks";

  absl::flat_hash_map<std::string, int> reference_count;
  for (const auto& block : blocks_) {
    METRICSQL_RET_CHECK_NE(block->table.empty(), block->from_alias.empty())
        << "Block " << block->alias
        << " must have exactly one of a table and a child source";
    if (!block->from_alias.empty()) {
      ++reference_count[block->from_alias];
    }
    for (const JoinChild& join : block->joins) {
      ++reference_count[join.alias];
    }

    absl::flat_hash_set<std::string> names;
    for (const auto* fields : {&block->dimensions, &block->measures}) {
      for (const FieldNode& field : *fields) {
        METRICSQL_RET_CHECK(names.insert(field.name).second)
            << "Duplicate field " << field.name << " in block "
            << block->alias;
      }
    }
    METRICSQL_RET_CHECK(!block->select_star || names.empty())
        << "Block " << block->alias << " selects * and named fields";

    for (const OrderField& order : block->order) {
      if (order.field.empty()) {
        METRICSQL_RET_CHECK(!order.expr.empty())
            << "Empty order field in block " << block->alias;
        continue;
      }
      METRICSQL_RET_CHECK(names.contains(order.field))
          << "Order field " << order.field << " is not selected by block "
          << block->alias;
    }
  }

  for (const auto& [alias, count] : reference_count) {
    METRICSQL_RET_CHECK(FindBlock(alias) != nullptr)
        << "Reference to unknown block " << alias;
    METRICSQL_RET_CHECK_EQ(count, 1)
        << "Block " << alias << " is referenced more than once";
  }
  METRICSQL_RET_CHECK(!reference_count.contains(root().alias))
      << "The root block is referenced as a child";
  return absl::OkStatus();
}

std::string PlanTree::DebugString() const {
  std::string out;
  for (const auto& block : blocks_) {
    absl::StrAppend(&out, block->alias, ":");
    if (!block->table.empty()) {
      absl::StrAppend(&out, " table=", block->table);
    } else {
      absl::StrAppend(&out, " from=", block->from_alias);
    }
    for (const JoinChild& join : block->joins) {
      absl::StrAppend(&out, " join=", join.alias);
    }
    absl::StrAppend(&out, " dims=", block->dimensions.size(),
                    " measures=", block->measures.size(),
                    block->grouped ? " grouped" : "", "\n");
  }
  return out;
}

}  // namespace metricsql
