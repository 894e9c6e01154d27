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
#include <vector>

#include "metricsql/base/testing/status_matchers.h"
#include "metricsql/common/errors.h"
#include "metricsql/dialects/druid_dialect.h"
#include "metricsql/dialects/duckdb_dialect.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace metricsql {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using metricsql_base::testing::StatusIs;

// Names resolve to escaped columns; subqueries to a fixed statement.
class ColumnScope : public TranslationScope {
 public:
  explicit ColumnScope(const Dialect* dialect) : dialect_(dialect) {}

  absl::StatusOr<SqlFragment> ResolveName(
      absl::string_view name) const override {
    if (name == "unknown") {
      return absl::NotFoundError(absl::StrCat("no field ", name));
    }
    return SqlFragment(dialect_->EscapeIdentifier(name));
  }

  absl::StatusOr<SqlFragment> CompileSubquery(
      const Subquery& subquery) const override {
    return SqlFragment(
        absl::StrCat("SELECT ", dialect_->EscapeIdentifier(subquery.dimension),
                     " FROM t WHERE x > ?"),
        {Value::Int64(7)});
  }

 private:
  const Dialect* dialect_;
};

class ExpressionTranslatorTest : public ::testing::Test {
 protected:
  absl::StatusOr<SqlFragment> Translate(const Expression& expr) {
    ColumnScope scope(&duckdb_);
    return ExpressionTranslator(&duckdb_, &scope).Translate(expr);
  }

  DuckDbDialect duckdb_;
};

TEST_F(ExpressionTranslatorTest, EqualityAgainstNullIsNullTest) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(
      SqlFragment out,
      Translate(ConditionExpr(Operator::kEq,
                              {NameExpr("x"), ValueExpr(Value::Null())})));
  EXPECT_EQ(out.sql, "\"x\" IS NULL");
  EXPECT_THAT(out.args, IsEmpty());

  METRICSQL_ASSERT_OK_AND_ASSIGN(
      out, Translate(ConditionExpr(Operator::kNeq, {ValueExpr(Value::Null()),
                                                    NameExpr("x")})));
  EXPECT_EQ(out.sql, "\"x\" IS NOT NULL");
  EXPECT_THAT(out.args, IsEmpty());
}

TEST_F(ExpressionTranslatorTest, ComparisonBindsValues) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(
      SqlFragment out,
      Translate(CompareExpr(Operator::kGte, "views", Value::Int64(10))));
  EXPECT_EQ(out.sql, "\"views\" >= ?");
  EXPECT_THAT(out.args, ElementsAre(Value::Int64(10)));

  METRICSQL_ASSERT_OK_AND_ASSIGN(
      out, Translate(CompareExpr(Operator::kNlike, "city", Value::String("L%"))));
  EXPECT_EQ(out.sql, "\"city\" NOT LIKE ?");
  EXPECT_THAT(out.args, ElementsAre(Value::String("L%")));
}

TEST_F(ExpressionTranslatorTest, InListEmitsOnePlaceholderPerElement) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(
      SqlFragment out,
      Translate(ConditionExpr(
          Operator::kIn,
          {NameExpr("city"),
           ValueExpr(Value::StringList({"London", "Paris"}))})));
  EXPECT_EQ(out.sql, "\"city\" IN (?, ?)");
  EXPECT_THAT(out.args,
              ElementsAre(Value::String("London"), Value::String("Paris")));
}

TEST_F(ExpressionTranslatorTest, InListWithNullMatchesNullRows) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(
      SqlFragment out,
      Translate(ConditionExpr(
          Operator::kIn,
          {NameExpr("city"),
           ValueExpr(Value::List({Value::String("Oslo"), Value::Null()}))})));
  EXPECT_EQ(out.sql, "(\"city\" IN (?) OR \"city\" IS NULL)");
  EXPECT_THAT(out.args, ElementsAre(Value::String("Oslo")));

  METRICSQL_ASSERT_OK_AND_ASSIGN(
      out, Translate(ConditionExpr(
               Operator::kNin,
               {NameExpr("city"),
                ValueExpr(Value::List({Value::String("Oslo"),
                                       Value::Null()}))})));
  EXPECT_EQ(out.sql, "(\"city\" NOT IN (?) AND \"city\" IS NOT NULL)");
}

TEST_F(ExpressionTranslatorTest, EmptyInList) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(
      SqlFragment out,
      Translate(ConditionExpr(Operator::kIn,
                              {NameExpr("city"), ValueExpr(Value::List({}))})));
  EXPECT_EQ(out.sql, "1 = 0");
  METRICSQL_ASSERT_OK_AND_ASSIGN(
      out, Translate(ConditionExpr(Operator::kNin, {NameExpr("city"),
                                                    ValueExpr(Value::List({}))})));
  EXPECT_EQ(out.sql, "1 = 1");
}

TEST_F(ExpressionTranslatorTest, LogicalOperatorsKeepArgumentOrder) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(
      SqlFragment out,
      Translate(OrExpr(
          {CompareExpr(Operator::kEq, "country", Value::String("NO")),
           AndExpr({CompareExpr(Operator::kGt, "views", Value::Int64(1)),
                    CompareExpr(Operator::kLt, "views", Value::Int64(9))})})));
  EXPECT_EQ(out.sql,
            "(\"country\" = ? OR (\"views\" > ? AND \"views\" < ?))");
  EXPECT_THAT(out.args, ElementsAre(Value::String("NO"), Value::Int64(1),
                                    Value::Int64(9)));
}

TEST_F(ExpressionTranslatorTest, ILikeIsNativeWhenSupported) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(
      SqlFragment out,
      Translate(CompareExpr(Operator::kIlike, "x", Value::String("a%"))));
  EXPECT_EQ(out.sql, "\"x\" ILIKE ?");
}

TEST(ExpressionTranslatorFallbackTest, ILikeFallsBackToLower) {
  DruidDialect druid;
  ColumnScope scope(&druid);
  ExpressionTranslator translator(&druid, &scope);
  METRICSQL_ASSERT_OK_AND_ASSIGN(
      SqlFragment out,
      translator.Translate(
          CompareExpr(Operator::kIlike, "x", Value::String("a%"))));
  EXPECT_EQ(out.sql, "lower(\"x\") LIKE lower(?)");
  EXPECT_THAT(out.args, ElementsAre(Value::String("a%")));

  METRICSQL_ASSERT_OK_AND_ASSIGN(
      out, translator.Translate(
               CompareExpr(Operator::kNilike, "x", Value::String("a%"))));
  EXPECT_EQ(out.sql, "lower(\"x\") NOT LIKE lower(?)");
}

TEST_F(ExpressionTranslatorTest, SubqueryArgumentsFollowTextOrder) {
  Subquery subquery;
  subquery.dimension = "country";
  Expression expr = AndExpr(
      {CompareExpr(Operator::kEq, "device", Value::String("mobile")),
       ConditionExpr(Operator::kIn,
                     {NameExpr("country"), SubqueryExpr(subquery)})});
  METRICSQL_ASSERT_OK_AND_ASSIGN(SqlFragment out, Translate(expr));
  EXPECT_EQ(out.sql,
            "(\"device\" = ? AND \"country\" IN (SELECT \"country\" FROM t "
            "WHERE x > ?))");
  EXPECT_THAT(out.args,
              ElementsAre(Value::String("mobile"), Value::Int64(7)));
}

TEST_F(ExpressionTranslatorTest, Deterministic) {
  const Expression expr = ConditionExpr(
      Operator::kIn,
      {NameExpr("city"), ValueExpr(Value::StringList({"a", "b", "c"}))});
  METRICSQL_ASSERT_OK_AND_ASSIGN(SqlFragment first, Translate(expr));
  METRICSQL_ASSERT_OK_AND_ASSIGN(SqlFragment second, Translate(expr));
  EXPECT_EQ(first.sql, second.sql);
  EXPECT_EQ(first.args, second.args);
}

TEST_F(ExpressionTranslatorTest, MalformedExpressions) {
  EXPECT_THAT(Translate(Expression()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("none of name, value, condition")));
  EXPECT_THAT(Translate(AndExpr({})),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("requires at least 2 operands, got 0")));
  EXPECT_THAT(
      Translate(OrExpr({CompareExpr(Operator::kEq, "x", Value::Int64(1))})),
      StatusIs(absl::StatusCode::kInvalidArgument,
               HasSubstr("requires at least 2 operands, got 1")));
  EXPECT_THAT(Translate(ConditionExpr(Operator::kEq, {NameExpr("x")})),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("requires 2 operands")));
  EXPECT_THAT(
      Translate(ConditionExpr(Operator::kEq,
                              {NameExpr("x"),
                               ValueExpr(Value::StringList({"a"}))})),
      StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("List literal")));
  EXPECT_THAT(Translate(ConditionExpr(Operator::kIn,
                                      {NameExpr("x"), NameExpr("y")})),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("list literal or a subquery")));
  EXPECT_EQ(GetCompileErrorKind(Translate(Expression()).status()), VALIDATION);
}

TEST_F(ExpressionTranslatorTest, ScopeErrorsPropagate) {
  EXPECT_THAT(Translate(CompareExpr(Operator::kEq, "unknown", Value::Int64(1))),
              StatusIs(absl::StatusCode::kNotFound, HasSubstr("no field")));
}

TEST_F(ExpressionTranslatorTest, DefaultScopeRejectsSubqueries) {
  class NoSubqueries : public TranslationScope {
   public:
    absl::StatusOr<SqlFragment> ResolveName(
        absl::string_view name) const override {
      return SqlFragment(std::string(name));
    }
  };
  NoSubqueries scope;
  Subquery subquery;
  subquery.dimension = "country";
  EXPECT_THAT(
      ExpressionTranslator(&duckdb_, &scope)
          .Translate(ConditionExpr(Operator::kIn,
                                   {NameExpr("country"),
                                    SubqueryExpr(subquery)})),
      StatusIs(absl::StatusCode::kUnimplemented));
}

TEST_F(ExpressionTranslatorTest, RejectsDeepNesting) {
  Expression expr = CompareExpr(Operator::kEq, "x", Value::Int64(1));
  for (int i = 0; i < 300; ++i) {
    expr = AndExpr({expr, CompareExpr(Operator::kLt, "x", Value::Int64(9))});
  }
  EXPECT_THAT(Translate(expr), StatusIs(absl::StatusCode::kInvalidArgument,
                                        HasSubstr("nesting")));
}

}  // namespace
}  // namespace metricsql
