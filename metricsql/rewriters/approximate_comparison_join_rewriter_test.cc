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

#include <memory>
#include <string>
#include <utility>

#include "metricsql/base/testing/status_matchers.h"
#include "metricsql/common/errors.h"
#include "metricsql/dialects/druid_dialect.h"
#include "metricsql/dialects/duckdb_dialect.h"
#include "metricsql/planner/plan_builder.h"
#include "metricsql/planner/sql_emitter.h"
#include "metricsql/public/compiler_options.h"
#include "metricsql/proto/options.pb.h"
#include "metricsql/testing/test_metrics_view.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/time/time.h"

namespace metricsql {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::Optional;
using metricsql_base::testing::StatusIs;

class ApproximateComparisonJoinRewriterTest : public ::testing::Test {
 protected:
  ApproximateComparisonJoinRewriterTest()
      : view_(test_util::MakeWebsiteAnalyticsView()) {
    options_.set_allow_approximate_comparisons(true);
    context_.view = view_.get();
    context_.dialect = &duckdb_;
    context_.options = &options_;
  }

  // Countries by views with the previous day's views, sorted by `sort`.
  Query ComparisonQuery(absl::string_view sort) const {
    const absl::Time end = test_util::TestExecutionTime();
    Query query;
    query.metrics_view = "WebsiteAnalytics";
    query.dimensions.push_back(Dimension{"country"});
    query.measures.push_back(Measure{"total_views"});
    Measure previous;
    previous.name = "previous";
    MeasureCompute compute;
    compute.kind = MeasureCompute::COMPARISON_VALUE;
    compute.target = "total_views";
    previous.compute = compute;
    query.measures.push_back(previous);
    TimeRange current;
    current.start = end - absl::Hours(24);
    current.end = end;
    query.time_range = current;
    TimeRange comparison;
    comparison.start = end - absl::Hours(48);
    comparison.end = end - absl::Hours(24);
    query.comparison_time_range = comparison;
    query.sort.push_back(Sort{std::string(sort), /*desc=*/true});
    query.limit = 10;
    return query;
  }

  PlanTree Build(const Query& query) {
    PlanBuilder builder(view_.get(), nullptr, context_.dialect,
                        CalendarSettings());
    absl::StatusOr<PlanTree> tree = builder.Build(query);
    METRICSQL_EXPECT_OK(tree.status());
    return std::move(tree).value();
  }

  absl::Status Rewrite(PlanTree* tree) {
    return GetApproximateComparisonJoinRewriter()->RewritePlan(context_, tree,
                                                               properties_);
  }

  DuckDbDialect duckdb_;
  std::unique_ptr<MetricsView> view_;
  CompilerOptions options_;
  RewriteContext context_;
  RewriteOutputProperties properties_;
};

TEST_F(ApproximateComparisonJoinRewriterTest, AnchorsOnCurrentPeriod) {
  PlanTree tree = Build(ComparisonQuery("total_views"));
  METRICSQL_ASSERT_OK(Rewrite(&tree));
  EXPECT_EQ(tree.root().joins[0].kind, JoinKind::kLeft);

  const SelectBlock* current = tree.FindBlock("base_current");
  ASSERT_NE(current, nullptr);
  ASSERT_EQ(current->order.size(), 1);
  EXPECT_EQ(current->order[0].field, "total_views");
  EXPECT_TRUE(current->order[0].desc);
  EXPECT_THAT(current->limit, Optional(10));
  EXPECT_FALSE(tree.FindBlock("base_comparison")->limit.has_value());

  METRICSQL_ASSERT_OK_AND_ASSIGN(SqlFragment sql,
                                 SqlEmitter(&duckdb_).Emit(tree));
  EXPECT_THAT(sql.sql,
              HasSubstr("GROUP BY \"country\" ORDER BY SUM(views) DESC LIMIT "
                        "10) AS \"base_current\" LEFT OUTER JOIN"));
}

TEST_F(ApproximateComparisonJoinRewriterTest, AnchorsOnComparisonPeriod) {
  Query query = ComparisonQuery("previous");
  query.offset = 5;
  PlanTree tree = Build(query);
  METRICSQL_ASSERT_OK(Rewrite(&tree));
  EXPECT_EQ(tree.root().joins[0].kind, JoinKind::kRight);
  const SelectBlock* comparison = tree.FindBlock("base_comparison");
  ASSERT_EQ(comparison->order.size(), 1);
  EXPECT_EQ(comparison->order[0].field, "total_views");
  // The root still skips the offset rows.
  EXPECT_THAT(comparison->limit, Optional(15));
  EXPECT_FALSE(tree.FindBlock("base_current")->limit.has_value());
}

TEST_F(ApproximateComparisonJoinRewriterTest, ComputedSortIsNotPushedDown) {
  Query query = ComparisonQuery("total_views");
  Measure delta;
  delta.name = "delta";
  MeasureCompute compute;
  compute.kind = MeasureCompute::COMPARISON_DELTA;
  compute.target = "total_views";
  delta.compute = compute;
  query.measures.push_back(delta);
  query.sort = {Sort{"delta", true}};
  PlanTree tree = Build(query);
  METRICSQL_ASSERT_OK(Rewrite(&tree));
  EXPECT_EQ(tree.root().joins[0].kind, JoinKind::kLeft);
  EXPECT_FALSE(tree.FindBlock("base_current")->limit.has_value());
  EXPECT_TRUE(tree.FindBlock("base_current")->order.empty());
}

TEST_F(ApproximateComparisonJoinRewriterTest, HavingPreventsPushDown) {
  Query query = ComparisonQuery("total_views");
  query.having = CompareExpr(Operator::kGt, "previous", Value::Int64(3));
  PlanTree tree = Build(query);
  METRICSQL_ASSERT_OK(Rewrite(&tree));
  EXPECT_EQ(tree.root().joins[0].kind, JoinKind::kLeft);
  EXPECT_FALSE(tree.FindBlock("base_current")->limit.has_value());
}

TEST_F(ApproximateComparisonJoinRewriterTest, ExactByDefault) {
  options_.set_allow_approximate_comparisons(false);
  PlanTree tree = Build(ComparisonQuery("total_views"));
  METRICSQL_ASSERT_OK(Rewrite(&tree));
  EXPECT_EQ(tree.root().joins[0].kind, JoinKind::kFullOuter);
  METRICSQL_ASSERT_OK_AND_ASSIGN(SqlFragment sql,
                                 SqlEmitter(&duckdb_).Emit(tree));
  EXPECT_THAT(sql.sql, HasSubstr("FULL OUTER JOIN"));
  EXPECT_THAT(sql.sql, Not(HasSubstr("LIMIT 10)")));
}

TEST_F(ApproximateComparisonJoinRewriterTest, DialectWithoutSupport) {
  DruidDialect druid;
  context_.dialect = &druid;
  PlanTree tree = Build(ComparisonQuery("total_views"));
  const absl::Status status = Rewrite(&tree);
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kFailedPrecondition,
                               HasSubstr("dialect druid does not support")));
  EXPECT_EQ(GetCompileErrorKind(status), REWRITE);
  EXPECT_THAT(GetRewritePass(status),
              Optional(REWRITE_APPROXIMATE_COMPARISON_JOIN));
  EXPECT_EQ(tree.root().joins[0].kind, JoinKind::kFullOuter);

  // Without the option, or without a comparison join, there is nothing to
  // reject.
  options_.set_allow_approximate_comparisons(false);
  METRICSQL_EXPECT_OK(Rewrite(&tree));
  options_.set_allow_approximate_comparisons(true);
  Query query = ComparisonQuery("total_views");
  query.measures.pop_back();
  query.comparison_time_range.reset();
  PlanTree single = Build(query);
  METRICSQL_EXPECT_OK(Rewrite(&single));
}

TEST_F(ApproximateComparisonJoinRewriterTest, PlansWithoutJoinsAreUntouched) {
  Query query = ComparisonQuery("total_views");
  query.measures.pop_back();
  query.comparison_time_range.reset();
  PlanTree tree = Build(query);
  METRICSQL_ASSERT_OK(Rewrite(&tree));
  EXPECT_EQ(tree.num_blocks(), 1);
  EXPECT_THAT(tree.root().limit, Optional(10));
}

}  // namespace
}  // namespace metricsql
