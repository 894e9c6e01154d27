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

#ifndef METRICSQL_PUBLIC_EXPRESSION_H_
#define METRICSQL_PUBLIC_EXPRESSION_H_

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/strings/string_view.h"
#include "metricsql/public/value.h"

namespace metricsql {

class Expression;

// The closed set of condition operators.
enum class Operator {
  kEq,
  kNeq,
  kLt,
  kLte,
  kGt,
  kGte,
  kIn,
  kNin,
  kIlike,
  kNilike,
  kAnd,
  kOr,
  kLike,
  kNlike,
};

// Returns the lower-case name of `op` ("eq", "nin", ...).
absl::string_view OperatorName(Operator op);

// Binary comparisons: eq, neq, lt, lte, gt, gte, like, nlike, ilike, nilike.
bool IsComparisonOperator(Operator op);

// and, or.
bool IsLogicalOperator(Operator op);

// in, nin.
bool IsListOperator(Operator op);

// An operator applied to an ordered list of operands.
struct Condition {
  Operator op = Operator::kAnd;
  std::vector<Expression> operands;

  bool operator==(const Condition& other) const;
  bool operator!=(const Condition& other) const { return !(*this == other); }
};

// A correlated filter on one dimension: the dimension values for which the
// grouped `measures` satisfy `having` (after `where` is applied). Used as the
// right-hand side of in/nin, e.g.
//
//   country IN (SELECT country FROM ... GROUP BY country HAVING sum(x) > 10)
struct Subquery {
  Subquery() = default;
  Subquery(const Subquery& other);
  Subquery& operator=(const Subquery& other);
  Subquery(Subquery&&) = default;
  Subquery& operator=(Subquery&&) = default;
  ~Subquery();

  std::string dimension;
  std::vector<std::string> measures;
  // Either may be null.
  std::unique_ptr<Expression> where;
  std::unique_ptr<Expression> having;

  bool operator==(const Subquery& other) const;
  bool operator!=(const Subquery& other) const { return !(*this == other); }
};

// A filter or condition expression. A tagged union with exactly one of
// {Name, Value, Condition, Subquery} populated. A default constructed
// Expression has none populated; it is representable only so that malformed
// input can be reported by validation rather than silently defaulted.
class Expression {
 public:
  enum Kind {
    EMPTY,
    NAME,
    VALUE,
    CONDITION,
    SUBQUERY,
  };

  Expression() = default;
  Expression(const Expression&) = default;
  Expression(Expression&&) = default;
  Expression& operator=(const Expression&) = default;
  Expression& operator=(Expression&&) = default;

  Kind kind() const { return static_cast<Kind>(rep_.index()); }

  // REQUIRES: the corresponding kind().
  const std::string& name() const { return std::get<std::string>(rep_); }
  const Value& value() const { return std::get<Value>(rep_); }
  const Condition& condition() const { return std::get<Condition>(rep_); }
  const Subquery& subquery() const { return std::get<Subquery>(rep_); }

  Condition* mutable_condition() { return std::get_if<Condition>(&rep_); }

  std::string DebugString() const;

  bool operator==(const Expression& other) const { return rep_ == other.rep_; }
  bool operator!=(const Expression& other) const { return !(*this == other); }

 private:
  friend Expression NameExpr(absl::string_view name);
  friend Expression ValueExpr(Value value);
  friend Expression ConditionExpr(Operator op,
                                  std::vector<Expression> operands);
  friend Expression SubqueryExpr(Subquery subquery);

  // The alternative order matches Kind.
  std::variant<std::monostate, std::string, Value, Condition, Subquery> rep_;
};

// Factories for the four variants.
Expression NameExpr(absl::string_view name);
Expression ValueExpr(Value value);
Expression ConditionExpr(Operator op, std::vector<Expression> operands);
Expression SubqueryExpr(Subquery subquery);

// Shorthands for common shapes.
Expression AndExpr(std::vector<Expression> operands);
Expression OrExpr(std::vector<Expression> operands);
Expression CompareExpr(Operator op, absl::string_view name, Value value);

// Returns `lhs AND rhs`, where either side may be absent. Nested ANDs are
// flattened.
std::optional<Expression> CombineWithAnd(std::optional<Expression> lhs,
                                         std::optional<Expression> rhs);

std::ostream& operator<<(std::ostream& out, const Expression& expr);

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_EXPRESSION_H_
