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

#ifndef METRICSQL_PLANNER_EXPRESSION_TRANSLATOR_H_
#define METRICSQL_PLANNER_EXPRESSION_TRANSLATOR_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "metricsql/planner/plan_tree.h"
#include "metricsql/public/dialect.h"
#include "metricsql/public/expression.h"

namespace metricsql {

// Supplies the meaning of names and subqueries to an ExpressionTranslator.
class TranslationScope {
 public:
  virtual ~TranslationScope() = default;

  // Returns the SQL a Name expression stands for in this scope.
  virtual absl::StatusOr<SqlFragment> ResolveName(
      absl::string_view name) const = 0;

  // Returns a complete SELECT statement for `subquery`, unparenthesized.
  // Defaults to an UNSUPPORTED_FEATURE error.
  virtual absl::StatusOr<SqlFragment> CompileSubquery(
      const Subquery& subquery) const;
};

// Translates filter expressions into SQL with positional arguments.
//
// Translation is a single recursive pass. All state of one Translate() call
// lives in a context object local to that call, so one translator may be used
// for any number of expressions, and concurrently.
//
//   Name       resolved through the scope; never bound as a literal.
//   Value      '?' with the value appended to the arguments. Lists become
//              one '?' per element.
//   Condition  see TranslateCondition().
//   Subquery   the scope's compiled subquery, parenthesized.
class ExpressionTranslator {
 public:
  // `dialect` and `scope` must outlive the translator.
  ExpressionTranslator(const Dialect* dialect, const TranslationScope* scope)
      : dialect_(dialect), scope_(scope) {}
  ExpressionTranslator(const ExpressionTranslator&) = delete;
  ExpressionTranslator& operator=(const ExpressionTranslator&) = delete;

  absl::StatusOr<SqlFragment> Translate(const Expression& expr) const;

 private:
  class Context;

  absl::Status TranslateExpr(const Expression& expr, Context* context) const;
  absl::Status TranslateValue(const Value& value, Context* context) const;
  absl::Status TranslateCondition(const Condition& condition,
                                  Context* context) const;
  absl::Status TranslateComparison(const Condition& condition,
                                   Context* context) const;
  absl::Status TranslateLike(const Condition& condition,
                             Context* context) const;
  absl::Status TranslateLogical(const Condition& condition,
                                Context* context) const;
  absl::Status TranslateIn(const Condition& condition, Context* context) const;
  absl::Status TranslateSubquery(const Subquery& subquery,
                                 Context* context) const;

  const Dialect* dialect_;
  const TranslationScope* scope_;
};

}  // namespace metricsql

#endif  // METRICSQL_PLANNER_EXPRESSION_TRANSLATOR_H_
