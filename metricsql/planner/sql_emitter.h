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

#ifndef METRICSQL_PLANNER_SQL_EMITTER_H_
#define METRICSQL_PLANNER_SQL_EMITTER_H_

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "metricsql/planner/plan_tree.h"
#include "metricsql/public/dialect.h"

namespace metricsql {

// Prints a finished plan tree as one SQL statement. Each block becomes
//
//   SELECT fields FROM source [JOIN ...] [WHERE ...] [GROUP BY ...]
//   [HAVING ...] [ORDER BY ...] [LIMIT ... OFFSET ...]
//
// with child blocks printed depth-first as parenthesized, aliased derived
// tables. Arguments are collected in the order their placeholders are
// printed; a fragment printed twice contributes its arguments twice.
class SqlEmitter {
 public:
  // `dialect` must outlive the emitter.
  explicit SqlEmitter(const Dialect* dialect) : dialect_(dialect) {}
  SqlEmitter(const SqlEmitter&) = delete;
  SqlEmitter& operator=(const SqlEmitter&) = delete;

  // Validates `tree` and prints it. Nothing is returned on error.
  absl::StatusOr<SqlFragment> Emit(const PlanTree& tree) const;

 private:
  absl::Status EmitBlock(const PlanTree& tree, const SelectBlock& block,
                         SqlFragment* out) const;
  absl::Status EmitDerivedTable(const PlanTree& tree, absl::string_view alias,
                                SqlFragment* out) const;

  const Dialect* dialect_;
};

}  // namespace metricsql

#endif  // METRICSQL_PLANNER_SQL_EMITTER_H_
