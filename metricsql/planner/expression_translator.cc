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

#include "metricsql/planner/expression_translator.h"

#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/base/status_macros.h"
#include "metricsql/common/errors.h"

namespace metricsql {

namespace {

// Nesting deeper than this is rejected instead of risking the stack.
constexpr int kMaxExpressionDepth = 256;

bool IsNullLiteral(const Expression& expr) {
  return expr.kind() == Expression::VALUE && expr.value().is_null();
}

absl::string_view ComparisonSql(Operator op) {
  switch (op) {
    case Operator::kEq:
      return "=";
    case Operator::kNeq:
      return "!=";
    case Operator::kLt:
      return "<";
    case Operator::kLte:
      return "<=";
    case Operator::kGt:
      return ">";
    case Operator::kGte:
      return ">=";
    case Operator::kLike:
      return "LIKE";
    case Operator::kNlike:
      return "NOT LIKE";
    default:
      return "";
  }
}

}  // namespace

absl::StatusOr<SqlFragment> TranslationScope::CompileSubquery(
    const Subquery& subquery) const {
  return MakeUnsupportedFeatureError()
         << "Subqueries are not supported in this context (dimension "
         << subquery.dimension << ")";
}

// The output of one top-level Translate() call. Child translations write into
// the same fragment; nested contexts are only created for operands that are
// assembled out of order.
class ExpressionTranslator::Context {
 public:
  explicit Context(int depth) : depth_(depth) {}

  SqlFragment* out() { return &out_; }
  int depth() const { return depth_; }
  SqlFragment Release() { return std::move(out_); }

 private:
  SqlFragment out_;
  const int depth_;
};

absl::StatusOr<SqlFragment> ExpressionTranslator::Translate(
    const Expression& expr) const {
  METRICSQL_RET_CHECK(dialect_ != nullptr);
  METRICSQL_RET_CHECK(scope_ != nullptr);
  Context context(/*depth=*/0);
  METRICSQL_RETURN_IF_ERROR(TranslateExpr(expr, &context));
  return context.Release();
}

absl::Status ExpressionTranslator::TranslateExpr(const Expression& expr,
                                                 Context* context) const {
  if (context->depth() > kMaxExpressionDepth) {
    return MakeValidationError("")
           << "Expression nesting exceeds " << kMaxExpressionDepth
           << " levels";
  }
  switch (expr.kind()) {
    case Expression::NAME: {
      METRICSQL_ASSIGN_OR_RETURN(SqlFragment resolved,
                                 scope_->ResolveName(expr.name()));
      context->out()->Append(resolved);
      return absl::OkStatus();
    }
    case Expression::VALUE:
      return TranslateValue(expr.value(), context);
    case Expression::CONDITION:
      return TranslateCondition(expr.condition(), context);
    case Expression::SUBQUERY:
      return TranslateSubquery(expr.subquery(), context);
    case Expression::EMPTY:
      break;
  }
  return MakeValidationError("")
         << "Expression has none of name, value, condition or subquery set";
}

absl::Status ExpressionTranslator::TranslateValue(const Value& value,
                                                  Context* context) const {
  SqlFragment* out = context->out();
  if (!value.is_list()) {
    out->Append("?");
    out->args.push_back(value);
    return absl::OkStatus();
  }
  for (int i = 0; i < value.elements().size(); ++i) {
    const Value& element = value.elements()[i];
    if (element.is_list()) {
      return MakeValidationError("") << "Nested list literal: "
                                     << value.DebugString();
    }
    out->Append(i == 0 ? "?" : ", ?");
    out->args.push_back(element);
  }
  return absl::OkStatus();
}

absl::Status ExpressionTranslator::TranslateCondition(
    const Condition& condition, Context* context) const {
  switch (condition.op) {
    case Operator::kAnd:
    case Operator::kOr:
      return TranslateLogical(condition, context);
    case Operator::kIn:
    case Operator::kNin:
      return TranslateIn(condition, context);
    case Operator::kIlike:
    case Operator::kNilike:
      return TranslateLike(condition, context);
    default:
      return TranslateComparison(condition, context);
  }
}

absl::Status ExpressionTranslator::TranslateComparison(
    const Condition& condition, Context* context) const {
  if (condition.operands.size() != 2) {
    return MakeValidationError("")
           << "Operator " << OperatorName(condition.op)
           << " requires 2 operands, got " << condition.operands.size();
  }
  const absl::string_view sql_op = ComparisonSql(condition.op);
  METRICSQL_RET_CHECK(!sql_op.empty())
      << "Not a comparison: " << OperatorName(condition.op);
  const Expression& lhs = condition.operands[0];
  const Expression& rhs = condition.operands[1];

  // "= NULL" is never true; equality against NULL is a null test.
  if (condition.op == Operator::kEq || condition.op == Operator::kNeq) {
    const Expression* tested = nullptr;
    if (IsNullLiteral(rhs)) {
      tested = &lhs;
    } else if (IsNullLiteral(lhs)) {
      tested = &rhs;
    }
    if (tested != nullptr) {
      METRICSQL_RETURN_IF_ERROR(TranslateExpr(*tested, context));
      context->out()->Append(condition.op == Operator::kEq ? " IS NULL"
                                                           : " IS NOT NULL");
      return absl::OkStatus();
    }
  }

  for (const Expression& operand : condition.operands) {
    if (operand.kind() == Expression::VALUE && operand.value().is_list()) {
      return MakeValidationError("")
             << "List literal used with operator "
             << OperatorName(condition.op);
    }
  }
  Context nested(context->depth() + 1);
  METRICSQL_RETURN_IF_ERROR(TranslateExpr(lhs, &nested));
  nested.out()->Append(absl::StrCat(" ", sql_op, " "));
  METRICSQL_RETURN_IF_ERROR(TranslateExpr(rhs, &nested));
  context->out()->Append(nested.Release());
  return absl::OkStatus();
}

absl::Status ExpressionTranslator::TranslateLike(const Condition& condition,
                                                 Context* context) const {
  if (condition.operands.size() != 2) {
    return MakeValidationError("")
           << "Operator " << OperatorName(condition.op)
           << " requires 2 operands, got " << condition.operands.size();
  }
  const bool negated = condition.op == Operator::kNilike;
  Context lhs(context->depth() + 1);
  Context rhs(context->depth() + 1);
  METRICSQL_RETURN_IF_ERROR(TranslateExpr(condition.operands[0], &lhs));
  METRICSQL_RETURN_IF_ERROR(TranslateExpr(condition.operands[1], &rhs));

  SqlFragment* out = context->out();
  if (dialect_->SupportsILike()) {
    out->Append(lhs.Release());
    out->Append(negated ? " NOT ILIKE " : " ILIKE ");
    out->Append(rhs.Release());
    return absl::OkStatus();
  }
  out->Append("lower(");
  out->Append(lhs.Release());
  out->Append(negated ? ") NOT LIKE lower(" : ") LIKE lower(");
  out->Append(rhs.Release());
  out->Append(")");
  return absl::OkStatus();
}

absl::Status ExpressionTranslator::TranslateLogical(const Condition& condition,
                                                    Context* context) const {
  if (condition.operands.size() < 2) {
    return MakeValidationError("")
           << "Operator " << OperatorName(condition.op)
           << " requires at least 2 operands, got "
           << condition.operands.size();
  }
  const absl::string_view separator =
      condition.op == Operator::kAnd ? " AND " : " OR ";
  SqlFragment* out = context->out();
  out->Append("(");
  for (int i = 0; i < condition.operands.size(); ++i) {
    if (i > 0) out->Append(separator);
    Context nested(context->depth() + 1);
    METRICSQL_RETURN_IF_ERROR(TranslateExpr(condition.operands[i], &nested));
    out->Append(nested.Release());
  }
  out->Append(")");
  return absl::OkStatus();
}

absl::Status ExpressionTranslator::TranslateIn(const Condition& condition,
                                               Context* context) const {
  const bool negated = condition.op == Operator::kNin;
  if (condition.operands.size() != 2) {
    return MakeValidationError("")
           << "Operator " << OperatorName(condition.op)
           << " requires 2 operands, got " << condition.operands.size();
  }
  const Expression& rhs = condition.operands[1];
  Context lhs(context->depth() + 1);
  METRICSQL_RETURN_IF_ERROR(TranslateExpr(condition.operands[0], &lhs));
  const SqlFragment left = lhs.Release();
  SqlFragment* out = context->out();

  if (rhs.kind() == Expression::SUBQUERY) {
    out->Append(left);
    out->Append(negated ? " NOT IN " : " IN ");
    return TranslateSubquery(rhs.subquery(), context);
  }
  if (rhs.kind() != Expression::VALUE || !rhs.value().is_list()) {
    return MakeValidationError("")
           << "The second operand of " << OperatorName(condition.op)
           << " must be a list literal or a subquery";
  }

  std::vector<Value> values;
  bool has_null = false;
  for (const Value& element : rhs.value().elements()) {
    if (element.is_null()) {
      has_null = true;
    } else {
      values.push_back(element);
    }
  }

  // NULL never matches IN; a NULL element selects the NULL rows instead.
  SqlFragment in_list;
  if (!values.empty()) {
    Context list(context->depth() + 1);
    METRICSQL_RETURN_IF_ERROR(
        TranslateValue(Value::List(std::move(values)), &list));
    in_list.Append(left);
    in_list.Append(negated ? " NOT IN (" : " IN (");
    in_list.Append(list.Release());
    in_list.Append(")");
  }
  SqlFragment null_test;
  if (has_null) {
    null_test.Append(left);
    null_test.Append(negated ? " IS NOT NULL" : " IS NULL");
  }

  if (in_list.empty() && null_test.empty()) {
    // Empty list: nothing is IN it, everything is NOT IN it.
    out->Append(negated ? "1 = 1" : "1 = 0");
  } else if (null_test.empty()) {
    out->Append(in_list);
  } else if (in_list.empty()) {
    out->Append(null_test);
  } else {
    out->Append("(");
    out->Append(in_list);
    out->Append(negated ? " AND " : " OR ");
    out->Append(null_test);
    out->Append(")");
  }
  return absl::OkStatus();
}

absl::Status ExpressionTranslator::TranslateSubquery(const Subquery& subquery,
                                                     Context* context) const {
  METRICSQL_ASSIGN_OR_RETURN(SqlFragment compiled,
                             scope_->CompileSubquery(subquery));
  SqlFragment* out = context->out();
  out->Append("(");
  out->Append(compiled);
  out->Append(")");
  return absl::OkStatus();
}

}  // namespace metricsql
