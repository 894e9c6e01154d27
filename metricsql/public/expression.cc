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

#include "metricsql/public/expression.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace metricsql {

namespace {

std::unique_ptr<Expression> CloneOrNull(const std::unique_ptr<Expression>& e) {
  return e == nullptr ? nullptr : std::make_unique<Expression>(*e);
}

bool PointeesEqual(const std::unique_ptr<Expression>& a,
                   const std::unique_ptr<Expression>& b) {
  if (a == nullptr || b == nullptr) return a == b;
  return *a == *b;
}

}  // namespace

absl::string_view OperatorName(Operator op) {
  switch (op) {
    case Operator::kEq:
      return "eq";
    case Operator::kNeq:
      return "neq";
    case Operator::kLt:
      return "lt";
    case Operator::kLte:
      return "lte";
    case Operator::kGt:
      return "gt";
    case Operator::kGte:
      return "gte";
    case Operator::kIn:
      return "in";
    case Operator::kNin:
      return "nin";
    case Operator::kIlike:
      return "ilike";
    case Operator::kNilike:
      return "nilike";
    case Operator::kAnd:
      return "and";
    case Operator::kOr:
      return "or";
    case Operator::kLike:
      return "like";
    case Operator::kNlike:
      return "nlike";
  }
  return "unknown";
}

bool IsComparisonOperator(Operator op) {
  return !IsLogicalOperator(op) && !IsListOperator(op);
}

bool IsLogicalOperator(Operator op) {
  return op == Operator::kAnd || op == Operator::kOr;
}

bool IsListOperator(Operator op) {
  return op == Operator::kIn || op == Operator::kNin;
}

bool Condition::operator==(const Condition& other) const {
  return op == other.op && operands == other.operands;
}

Subquery::Subquery(const Subquery& other)
    : dimension(other.dimension),
      measures(other.measures),
      where(CloneOrNull(other.where)),
      having(CloneOrNull(other.having)) {}

Subquery& Subquery::operator=(const Subquery& other) {
  if (this != &other) {
    dimension = other.dimension;
    measures = other.measures;
    where = CloneOrNull(other.where);
    having = CloneOrNull(other.having);
  }
  return *this;
}

Subquery::~Subquery() = default;

bool Subquery::operator==(const Subquery& other) const {
  return dimension == other.dimension && measures == other.measures &&
         PointeesEqual(where, other.where) &&
         PointeesEqual(having, other.having);
}

std::string Expression::DebugString() const {
  switch (kind()) {
    case EMPTY:
      return "<empty>";
    case NAME:
      return name();
    case VALUE:
      return value().DebugString();
    case CONDITION: {
      const Condition& c = condition();
      return absl::StrCat(
          OperatorName(c.op), "(",
          absl::StrJoin(c.operands, ", ",
                        [](std::string* out, const Expression& e) {
                          absl::StrAppend(out, e.DebugString());
                        }),
          ")");
    }
    case SUBQUERY: {
      const Subquery& s = subquery();
      std::string out =
          absl::StrCat("subquery(", s.dimension, " [",
                       absl::StrJoin(s.measures, ", "), "]");
      if (s.where != nullptr) {
        absl::StrAppend(&out, " where ", s.where->DebugString());
      }
      if (s.having != nullptr) {
        absl::StrAppend(&out, " having ", s.having->DebugString());
      }
      absl::StrAppend(&out, ")");
      return out;
    }
  }
  return "<invalid expression>";
}

Expression NameExpr(absl::string_view name) {
  Expression e;
  e.rep_ = std::string(name);
  return e;
}

Expression ValueExpr(Value value) {
  Expression e;
  e.rep_ = std::move(value);
  return e;
}

Expression ConditionExpr(Operator op, std::vector<Expression> operands) {
  Expression e;
  e.rep_ = Condition{op, std::move(operands)};
  return e;
}

Expression SubqueryExpr(Subquery subquery) {
  Expression e;
  e.rep_ = std::move(subquery);
  return e;
}

Expression AndExpr(std::vector<Expression> operands) {
  return ConditionExpr(Operator::kAnd, std::move(operands));
}

Expression OrExpr(std::vector<Expression> operands) {
  return ConditionExpr(Operator::kOr, std::move(operands));
}

Expression CompareExpr(Operator op, absl::string_view name, Value value) {
  return ConditionExpr(op, {NameExpr(name), ValueExpr(std::move(value))});
}

std::optional<Expression> CombineWithAnd(std::optional<Expression> lhs,
                                         std::optional<Expression> rhs) {
  if (!lhs.has_value()) return rhs;
  if (!rhs.has_value()) return lhs;
  std::vector<Expression> operands;
  for (Expression* side : {&*lhs, &*rhs}) {
    Condition* c = side->mutable_condition();
    if (c != nullptr && c->op == Operator::kAnd) {
      for (Expression& operand : c->operands) {
        operands.push_back(std::move(operand));
      }
    } else {
      operands.push_back(std::move(*side));
    }
  }
  return AndExpr(std::move(operands));
}

std::ostream& operator<<(std::ostream& out, const Expression& expr) {
  return out << expr.DebugString();
}

}  // namespace metricsql
