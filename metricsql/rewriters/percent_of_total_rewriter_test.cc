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

#include "metricsql/rewriters/percent_of_total_rewriter.h"

#include <optional>

#include "metricsql/base/testing/status_matchers.h"
#include "metricsql/common/errors.h"
#include "metricsql/proto/options.pb.h"
#include "metricsql/testing/test_metrics_view.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"

namespace metricsql {
namespace {

using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::Optional;
using ::testing::SizeIs;
using metricsql_base::testing::StatusIs;

Query PercentQuery() {
  Query query;
  query.metrics_view = "WebsiteAnalytics";
  query.dimensions.push_back(Dimension{"country"});
  query.measures.push_back(Measure{"total_views"});
  Measure share;
  share.name = "share";
  MeasureCompute compute;
  compute.kind = MeasureCompute::PERCENT_OF_TOTAL;
  compute.target = "total_views";
  share.compute = compute;
  query.measures.push_back(share);
  query.where = CompareExpr(Operator::kEq, "device", Value::String("mobile"));
  query.having = CompareExpr(Operator::kGt, "total_views", Value::Int64(5));
  query.sort.push_back(Sort{"total_views", true});
  query.limit = 3;
  return query;
}

class PercentOfTotalRewriterTest : public ::testing::Test {
 protected:
  PercentOfTotalRewriterTest() { context_.execution_context = &execution_; }

  absl::Status Rewrite(Query* query) {
    return GetPercentOfTotalRewriter()->RewriteQuery(context_, query,
                                                     properties_);
  }

  ExecutionContext execution_;
  RewriteContext context_;
  RewriteOutputProperties properties_;
};

TEST_F(PercentOfTotalRewriterTest, FillsTotalFromExecutor) {
  test_util::FakeQueryExecutor executor(Value::Int64(400));
  context_.executor = &executor;
  Query query = PercentQuery();
  METRICSQL_ASSERT_OK(Rewrite(&query));
  EXPECT_THAT(query.measures[1].compute->total, Optional(400.0));

  // The grand total ignores dimensions, having, sort and limit.
  ASSERT_THAT(executor.queries(), SizeIs(1));
  const Query& total = executor.queries()[0];
  EXPECT_THAT(total.dimensions, IsEmpty());
  EXPECT_THAT(total.measures,
              ElementsAre(Field(&Measure::name, "total_views")));
  EXPECT_EQ(total.where, query.where);
  EXPECT_FALSE(total.having.has_value());
  EXPECT_THAT(total.sort, IsEmpty());
  EXPECT_FALSE(total.limit.has_value());

  // A resolved total is not fetched again.
  METRICSQL_ASSERT_OK(Rewrite(&query));
  EXPECT_THAT(executor.queries(), SizeIs(1));
}

TEST_F(PercentOfTotalRewriterTest, NullTotalIsZero) {
  test_util::FakeQueryExecutor executor(Value::Null());
  context_.executor = &executor;
  Query query = PercentQuery();
  METRICSQL_ASSERT_OK(Rewrite(&query));
  EXPECT_THAT(query.measures[1].compute->total, Optional(0.0));
}

TEST_F(PercentOfTotalRewriterTest, NonNumericTotalIsRewriteError) {
  test_util::FakeQueryExecutor executor(Value::String("many"));
  context_.executor = &executor;
  Query query = PercentQuery();
  const absl::Status status = Rewrite(&query);
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_EQ(GetCompileErrorKind(status), REWRITE);
}

TEST_F(PercentOfTotalRewriterTest, MissingExecutor) {
  Query query = PercentQuery();
  const absl::Status status = Rewrite(&query);
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(GetRewritePass(status), Optional(REWRITE_PERCENT_OF_TOTAL));
}

TEST_F(PercentOfTotalRewriterTest, ExecutorErrorsKeepTheirCode) {
  test_util::FakeQueryExecutor executor(
      absl::UnavailableError("backend is down"));
  context_.executor = &executor;
  Query query = PercentQuery();
  EXPECT_THAT(Rewrite(&query), StatusIs(absl::StatusCode::kUnavailable));
  EXPECT_FALSE(query.measures[1].compute->total.has_value());
}

TEST_F(PercentOfTotalRewriterTest, CancelledRequestIsNotExecuted) {
  test_util::FakeQueryExecutor executor(Value::Int64(1));
  context_.executor = &executor;
  execution_.set_cancellation_callback([] { return true; });
  Query query = PercentQuery();
  EXPECT_THAT(Rewrite(&query), StatusIs(absl::StatusCode::kCancelled));
  EXPECT_THAT(executor.queries(), IsEmpty());
}

TEST_F(PercentOfTotalRewriterTest, QueriesWithoutPercentAreUntouched) {
  Query query;
  query.measures.push_back(Measure{"total_views"});
  METRICSQL_ASSERT_OK(Rewrite(&query));
}

}  // namespace
}  // namespace metricsql
