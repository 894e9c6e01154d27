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

#include "metricsql/planner/sql_emitter.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "metricsql/base/logging.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/base/status_macros.h"

namespace metricsql {

absl::StatusOr<SqlFragment> SqlEmitter::Emit(const PlanTree& tree) const {
  METRICSQL_RETURN_IF_ERROR(tree.Validate());
  SqlFragment out;
  METRICSQL_RETURN_IF_ERROR(EmitBlock(tree, tree.root(), &out));
  METRICSQL_VLOG(3) << "Emitted SQL: " << out.sql;
  return out;
}

absl::Status SqlEmitter::EmitDerivedTable(const PlanTree& tree,
                                          absl::string_view alias,
                                          SqlFragment* out) const {
  const SelectBlock* child = tree.FindBlock(alias);
  METRICSQL_RET_CHECK(child != nullptr) << "Unknown block " << alias;
  out->Append("(");
  METRICSQL_RETURN_IF_ERROR(EmitBlock(tree, *child, out));
  out->Append(absl::StrCat(") AS ", dialect_->EscapeIdentifier(alias)));
  return absl::OkStatus();
}

absl::Status SqlEmitter::EmitBlock(const PlanTree& tree,
                                   const SelectBlock& block,
                                   SqlFragment* out) const {
  out->Append("SELECT ");
  if (block.select_star) {
    out->Append("*");
  } else {
    bool first = true;
    for (const auto* fields : {&block.dimensions, &block.measures}) {
      for (const FieldNode& field : *fields) {
        if (!first) out->Append(", ");
        first = false;
        out->Append(field.expr);
        out->Append(absl::StrCat(
            " AS ", dialect_->EscapeIdentifier(block.use_display_names
                                                   ? field.display_name
                                                   : field.name)));
      }
    }
    METRICSQL_RET_CHECK(!first) << "Block " << block.alias
                                << " selects nothing";
  }

  out->Append(" FROM ");
  if (!block.table.empty()) {
    out->Append(block.table);
  } else {
    METRICSQL_RETURN_IF_ERROR(EmitDerivedTable(tree, block.from_alias, out));
  }
  for (const JoinChild& join : block.joins) {
    out->Append(absl::StrCat(" ", dialect_->JoinKeyword(join.kind), " "));
    METRICSQL_RETURN_IF_ERROR(EmitDerivedTable(tree, join.alias, out));
    out->Append(" ON ");
    if (join.on.empty()) {
      out->Append("1 = 1");
    } else {
      out->Append(join.on);
    }
  }

  if (!block.where.empty()) {
    out->Append(" WHERE ");
    out->Append(block.where);
  }
  if (block.grouped && !block.dimensions.empty()) {
    out->Append(" GROUP BY ");
    for (int i = 0; i < block.dimensions.size(); ++i) {
      if (i > 0) out->Append(", ");
      out->Append(block.dimensions[i].expr);
    }
  }
  if (!block.having.empty()) {
    out->Append(" HAVING ");
    out->Append(block.having);
  }
  if (!block.order.empty()) {
    out->Append(" ORDER BY ");
    for (int i = 0; i < block.order.size(); ++i) {
      const OrderField& order = block.order[i];
      if (i > 0) out->Append(", ");
      if (order.field.empty()) {
        out->Append(order.expr);
      } else {
        const FieldNode* field = block.FindField(order.field);
        METRICSQL_RET_CHECK(field != nullptr)
            << "Unknown order field " << order.field;
        out->Append(field->expr);
      }
      if (order.desc) out->Append(" DESC");
    }
  }
  const std::string limit = dialect_->LimitClause(block.limit, block.offset);
  if (!limit.empty()) {
    out->Append(absl::StrCat(" ", limit));
  }
  return absl::OkStatus();
}

}  // namespace metricsql
