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

#include "metricsql/public/compiler.h"

#include <memory>
#include <string>

#include "metricsql/base/testing/status_matchers.h"
#include "metricsql/common/errors.h"
#include "metricsql/proto/compile_error.pb.h"
#include "metricsql/proto/options.pb.h"
#include "metricsql/testing/test_metrics_view.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/time/time.h"

namespace metricsql {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Optional;
using ::testing::SizeIs;
using ::testing::StartsWith;
using metricsql_base::testing::StatusIs;

class CompilerTest : public ::testing::Test {
 protected:
  CompilerTest()
      : view_(test_util::MakeWebsiteAnalyticsView()),
        now_(test_util::TestExecutionTime()) {
    options_.set_execution_time(now_);
  }

  // Top countries by views over the last day.
  Query TopCountries() const {
    Query query;
    query.metrics_view = "WebsiteAnalytics";
    query.dimensions.push_back(Dimension{"country"});
    query.measures.push_back(Measure{"total_views"});
    TimeRange range;
    range.iso_duration = "P1D";
    query.time_range = range;
    query.sort.push_back(Sort{"total_views", /*desc=*/true});
    query.limit = 10;
    return query;
  }

  Measure PercentOfTotal(absl::string_view name) const {
    Measure measure;
    measure.name = std::string(name);
    MeasureCompute compute;
    compute.kind = MeasureCompute::PERCENT_OF_TOTAL;
    compute.target = "total_views";
    measure.compute = compute;
    return measure;
  }

  absl::StatusOr<CompiledQuery> Compile(const Query& query,
                                        absl::string_view dialect = "duckdb",
                                        QueryExecutor* executor = nullptr) {
    return metricsql::Compile(query, *view_, /*security_policy=*/nullptr,
                              dialect, options_, context_, executor);
  }

  std::unique_ptr<MetricsView> view_;
  const absl::Time now_;
  CompilerOptions options_;
  ExecutionContext context_;
};

TEST_F(CompilerTest, TopCountriesOverTheLastDay) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(CompiledQuery compiled,
                                 Compile(TopCountries()));
  EXPECT_EQ(compiled.sql,
            "SELECT \"country\" AS \"country\", SUM(views) AS \"total_views\" "
            "FROM \"events\" WHERE \"ts\" >= ? AND \"ts\" < ? "
            "GROUP BY \"country\" ORDER BY SUM(views) DESC LIMIT 10");
  EXPECT_THAT(compiled.args,
              ElementsAre(Value::Timestamp(now_ - absl::Hours(24)),
                          Value::Timestamp(now_)));
  EXPECT_EQ(compiled.row_cap, 0);
  EXPECT_FALSE(compiled.IsTruncated(1000000));
}

TEST_F(CompilerTest, CompilationIsDeterministic) {
  METRICSQL_ASSERT_OK_AND_ASSIGN(CompiledQuery first, Compile(TopCountries()));
  METRICSQL_ASSERT_OK_AND_ASSIGN(CompiledQuery second,
                                 Compile(TopCountries()));
  EXPECT_EQ(first.sql, second.sql);
  EXPECT_EQ(first.args, second.args);
}

TEST_F(CompilerTest, RowCapAddsOneRowToDetectTruncation) {
  options_.set_row_cap(10);
  Query query = TopCountries();
  query.limit.reset();
  METRICSQL_ASSERT_OK_AND_ASSIGN(CompiledQuery compiled, Compile(query));
  EXPECT_THAT(compiled.sql, ::testing::EndsWith("LIMIT 11"));
  EXPECT_EQ(compiled.row_cap, 10);
  EXPECT_TRUE(compiled.IsTruncated(11));
  EXPECT_FALSE(compiled.IsTruncated(10));
}

TEST_F(CompilerTest, LimitAboveRowCapFails) {
  options_.set_row_cap(10);
  Query query = TopCountries();
  query.limit = 20;
  absl::StatusOr<CompiledQuery> compiled = Compile(query);
  EXPECT_THAT(compiled, StatusIs(absl::StatusCode::kOutOfRange));
  EXPECT_EQ(GetCompileErrorKind(compiled.status()), REWRITE);
  EXPECT_THAT(GetRewritePass(compiled.status()), Optional(REWRITE_ROW_CAP));
}

TEST_F(CompilerTest, DialectDefaultRowCap) {
  Query query = TopCountries();
  query.limit.reset();
  METRICSQL_ASSERT_OK_AND_ASSIGN(CompiledQuery compiled,
                                 Compile(query, "druid"));
  EXPECT_THAT(compiled.sql, ::testing::EndsWith("LIMIT 10001"));
  EXPECT_EQ(compiled.row_cap, 10000);
}

TEST_F(CompilerTest, PercentOfTotalBindsGrandTotal) {
  test_util::FakeQueryExecutor executor(Value::Int64(1000));
  Query query = TopCountries();
  query.measures.push_back(PercentOfTotal("share"));
  METRICSQL_ASSERT_OK_AND_ASSIGN(CompiledQuery compiled,
                                 Compile(query, "duckdb", &executor));
  EXPECT_THAT(compiled.sql,
              StartsWith("SELECT \"country\" AS \"country\", SUM(views) AS "
                         "\"total_views\", (SUM(views)) / ? * 100 AS "
                         "\"share\" FROM"));
  EXPECT_THAT(compiled.args,
              ElementsAre(Value::Double(1000),
                          Value::Timestamp(now_ - absl::Hours(24)),
                          Value::Timestamp(now_)));

  // The grand total is computed over the resolved time range.
  ASSERT_THAT(executor.queries(), SizeIs(1));
  const Query& total = executor.queries()[0];
  EXPECT_THAT(total.dimensions, IsEmpty());
  EXPECT_THAT(total.time_range->start, Optional(now_ - absl::Hours(24)));
}

TEST_F(CompilerTest, PercentOfTotalFailureProducesNoSql) {
  test_util::FakeQueryExecutor executor(
      absl::UnavailableError("warehouse unavailable"));
  Query query = TopCountries();
  query.measures.push_back(PercentOfTotal("share"));
  absl::StatusOr<CompiledQuery> compiled =
      Compile(query, "duckdb", &executor);
  EXPECT_THAT(compiled, StatusIs(absl::StatusCode::kUnavailable,
                                 HasSubstr("warehouse unavailable")));
  EXPECT_EQ(GetCompileErrorKind(compiled.status()), REWRITE);
  EXPECT_THAT(GetRewritePass(compiled.status()),
              Optional(REWRITE_PERCENT_OF_TOTAL));
}

TEST_F(CompilerTest, CancellationStopsPercentOfTotal) {
  test_util::FakeQueryExecutor executor(Value::Int64(1));
  context_.set_cancellation_callback([] { return true; });
  Query query = TopCountries();
  query.measures.push_back(PercentOfTotal("share"));
  EXPECT_THAT(Compile(query, "duckdb", &executor),
              StatusIs(absl::StatusCode::kCancelled));
  EXPECT_THAT(executor.queries(), IsEmpty());
}

TEST_F(CompilerTest, PeriodComparisonWithOffset) {
  Query query = TopCountries();
  Measure previous;
  previous.name = "total_views__previous";
  MeasureCompute compute;
  compute.kind = MeasureCompute::COMPARISON_VALUE;
  compute.target = "total_views";
  previous.compute = compute;
  query.measures.push_back(previous);
  TimeRange comparison;
  comparison.iso_offset = "P1D";
  query.comparison_time_range = comparison;

  METRICSQL_ASSERT_OK_AND_ASSIGN(CompiledQuery compiled, Compile(query));
  EXPECT_THAT(compiled.sql, HasSubstr("AS \"base_current\" FULL OUTER JOIN"));
  EXPECT_THAT(compiled.sql,
              HasSubstr("ON \"base_current\".\"country\" IS NOT DISTINCT FROM "
                        "\"base_comparison\".\"country\""));
  EXPECT_THAT(compiled.args,
              ElementsAre(Value::Timestamp(now_ - absl::Hours(24)),
                          Value::Timestamp(now_),
                          Value::Timestamp(now_ - absl::Hours(48)),
                          Value::Timestamp(now_ - absl::Hours(24))));

  options_.set_allow_approximate_comparisons(true);
  METRICSQL_ASSERT_OK_AND_ASSIGN(compiled, Compile(query));
  EXPECT_THAT(compiled.sql, HasSubstr("AS \"base_current\" LEFT OUTER JOIN"));
}

TEST_F(CompilerTest, ClickHouseGroupsComparisonJoins) {
  Query query = TopCountries();
  Measure delta;
  delta.name = "delta";
  MeasureCompute compute;
  compute.kind = MeasureCompute::COMPARISON_DELTA;
  compute.target = "total_views";
  delta.compute = compute;
  query.measures.push_back(delta);
  TimeRange comparison;
  comparison.iso_offset = "P1W";
  query.comparison_time_range = comparison;

  METRICSQL_ASSERT_OK_AND_ASSIGN(CompiledQuery compiled,
                                 Compile(query, "clickhouse"));
  EXPECT_THAT(compiled.sql, HasSubstr("any(\"base_current\".\"total_views\")"));
  EXPECT_THAT(compiled.sql,
              HasSubstr("ON isNotDistinctFrom(\"base_current\".\"country\", "
                        "\"base_comparison\".\"country\")"));
  EXPECT_THAT(compiled.sql,
              HasSubstr("GROUP BY COALESCE(\"base_current\".\"country\", "
                        "\"base_comparison\".\"country\") ORDER BY"));
}

TEST_F(CompilerTest, TimeGrainUsesQueryTimeZone) {
  Query query;
  query.metrics_view = "WebsiteAnalytics";
  query.dimensions.push_back(Dimension{"ts", TimeGrain::kDay});
  query.measures.push_back(Measure{"total_views"});
  query.time_zone = "UTC";
  METRICSQL_ASSERT_OK_AND_ASSIGN(CompiledQuery compiled, Compile(query));
  EXPECT_THAT(compiled.sql, HasSubstr("date_trunc('day', \"ts\") AS \"ts\""));
}

TEST_F(CompilerTest, ValidationErrorsStopBeforeRewrites) {
  test_util::FakeQueryExecutor executor(Value::Int64(1));
  Query query = TopCountries();
  query.measures.push_back(PercentOfTotal("share"));
  query.dimensions.push_back(Dimension{"planet"});
  absl::StatusOr<CompiledQuery> compiled =
      Compile(query, "duckdb", &executor);
  EXPECT_THAT(compiled, StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_EQ(GetCompileErrorKind(compiled.status()), VALIDATION);
  EXPECT_EQ(GetErrorField(compiled.status()), "dimensions[1]");
  EXPECT_THAT(executor.queries(), IsEmpty());
}

TEST_F(CompilerTest, AccessDenied) {
  SimpleSecurityPolicy policy;
  policy.AllowField("country");
  absl::StatusOr<CompiledQuery> compiled =
      metricsql::Compile(TopCountries(), *view_, &policy, "duckdb", options_,
                         context_, nullptr);
  EXPECT_THAT(compiled, StatusIs(absl::StatusCode::kPermissionDenied));
}

TEST_F(CompilerTest, RowFilterOfSecurityPolicy) {
  SimpleSecurityPolicy policy;
  policy.set_row_filter(
      CompareExpr(Operator::kEq, "country", Value::String("NO")));
  METRICSQL_ASSERT_OK_AND_ASSIGN(
      CompiledQuery compiled,
      metricsql::Compile(TopCountries(), *view_, &policy, "duckdb", options_,
                         context_, nullptr));
  EXPECT_THAT(compiled.sql,
              HasSubstr("WHERE \"country\" = ? AND \"ts\" >= ? AND \"ts\" < ?"));
  EXPECT_THAT(compiled.args, SizeIs(3));
}

TEST_F(CompilerTest, UnsupportedFeature) {
  Query query = TopCountries();
  query.pivot_on = {"country"};
  absl::StatusOr<CompiledQuery> compiled = Compile(query);
  EXPECT_THAT(compiled, StatusIs(absl::StatusCode::kUnimplemented));
  EXPECT_EQ(GetCompileErrorKind(compiled.status()), UNSUPPORTED_FEATURE);
}

TEST_F(CompilerTest, UnknownDialect) {
  EXPECT_THAT(Compile(TopCountries(), "oracle"),
              StatusIs(absl::StatusCode::kNotFound));
}

TEST_F(CompilerTest, InvalidOptions) {
  options_.set_first_day_of_week(9);
  EXPECT_THAT(Compile(TopCountries()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("first_day_of_week")));
}

TEST_F(CompilerTest, DisabledTimeRangeRewriteIsAnInvariantError) {
  options_.enable_rewrite(REWRITE_TIME_RANGE, false);
  absl::StatusOr<CompiledQuery> compiled = Compile(TopCountries());
  EXPECT_THAT(compiled, StatusIs(absl::StatusCode::kInternal));
  EXPECT_EQ(GetCompileErrorKind(compiled.status()), COMPILE_INVARIANT);
}

}  // namespace
}  // namespace metricsql
