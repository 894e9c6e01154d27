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

#ifndef METRICSQL_PLANNER_PLAN_TREE_H_
#define METRICSQL_PLANNER_PLAN_TREE_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "metricsql/public/dialect.h"
#include "metricsql/public/value.h"

namespace metricsql {

// A piece of SQL text with '?' placeholders and the values bound to them, in
// placeholder order. Fragments are concatenated by appending both parts, so
// that argument order always follows text order.
struct SqlFragment {
  SqlFragment() = default;
  explicit SqlFragment(std::string sql) : sql(std::move(sql)) {}
  SqlFragment(std::string sql, std::vector<Value> args)
      : sql(std::move(sql)), args(std::move(args)) {}

  bool empty() const { return sql.empty(); }

  // Appends `other` to this fragment.
  void Append(const SqlFragment& other);
  void Append(absl::string_view sql_text) { sql.append(sql_text); }

  std::string sql;
  std::vector<Value> args;
};

// One entry of a select list.
struct FieldNode {
  // Unique within the select list. Children are always referenced by name.
  std::string name;
  std::string display_name;
  SqlFragment expr;

  // Set when `expr` is a plain reference to column `source_field` of child
  // block `source_alias`.
  std::string source_alias;
  std::string source_field;
};

// A derived table joined to a block.
struct JoinChild {
  std::string alias;
  JoinKind kind = JoinKind::kFullOuter;
  // Empty means the join is unconditional.
  SqlFragment on;
};

// An ORDER BY entry. Either names a field of the block, or carries an
// explicit expression (used when ordering by something not selected).
struct OrderField {
  std::string field;
  SqlFragment expr;
  bool desc = false;
};

// One SELECT statement of the plan. The data source is either `table` or the
// child block `from_alias`, never both.
struct SelectBlock {
  std::string alias;

  std::vector<FieldNode> dimensions;
  std::vector<FieldNode> measures;
  // Raw rows: the select list is '*' and the field lists are empty.
  bool select_star = false;
  // Output columns are named by display name. Only set on the root.
  bool use_display_names = false;

  // The escaped, possibly qualified, base table.
  std::string table;
  std::string from_alias;
  std::vector<JoinChild> joins;

  SqlFragment where;
  bool grouped = false;
  SqlFragment having;
  std::vector<OrderField> order;
  std::optional<int64_t> limit;
  std::optional<int64_t> offset;

  // Searches dimensions, then measures. Returns nullptr if not found.
  const FieldNode* FindField(absl::string_view name) const;
  FieldNode* FindMutableField(absl::string_view name);
};

// The intermediate representation of one compiled statement: an arena of
// SelectBlocks referenced by alias. The first block added is the root.
//
// Owned exclusively by one compilation. Blocks are stable in memory for the
// lifetime of the tree, so SelectBlock pointers stay valid as blocks are
// added.
class PlanTree {
 public:
  PlanTree() = default;
  PlanTree(const PlanTree&) = delete;
  PlanTree& operator=(const PlanTree&) = delete;
  PlanTree(PlanTree&&) = default;
  PlanTree& operator=(PlanTree&&) = default;

  // Adds an empty block. Returns an error if `alias` is already used.
  absl::StatusOr<SelectBlock*> AddBlock(absl::string_view alias);

  // REQUIRES: at least one block.
  SelectBlock* mutable_root() { return blocks_.front().get(); }
  const SelectBlock& root() const { return *blocks_.front(); }
  bool empty() const { return blocks_.empty(); }
  int num_blocks() const { return static_cast<int>(blocks_.size()); }

  // Returns nullptr if not found.
  const SelectBlock* FindBlock(absl::string_view alias) const;
  SelectBlock* FindMutableBlock(absl::string_view alias);

  // All blocks in creation order, root first.
  std::vector<SelectBlock*> mutable_blocks();

  // Checks the structural invariants: every block has exactly one source,
  // every referenced child exists and is referenced exactly once, the root is
  // never referenced, field names are unique within a block and order fields
  // resolve. Violations are COMPILE_INVARIANT errors.
  absl::Status Validate() const;

  std::string DebugString() const;

 private:
  std::vector<std::unique_ptr<SelectBlock>> blocks_;
  absl::flat_hash_map<std::string, SelectBlock*> blocks_by_alias_;
};

}  // namespace metricsql

#endif  // METRICSQL_PLANNER_PLAN_TREE_H_
