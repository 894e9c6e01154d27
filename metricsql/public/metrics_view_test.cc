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

#include "metricsql/public/metrics_view.h"

#include <string>

#include "metricsql/base/testing/status_matchers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"

namespace metricsql {
namespace {

using ::testing::HasSubstr;
using metricsql_base::testing::IsOk;
using metricsql_base::testing::StatusIs;

DimensionDef ColumnDimension(absl::string_view name) {
  DimensionDef dimension;
  dimension.name = std::string(name);
  dimension.column = std::string(name);
  return dimension;
}

MeasureDef SimpleMeasure(absl::string_view name, absl::string_view expr) {
  MeasureDef measure;
  measure.name = std::string(name);
  measure.expression = std::string(expr);
  return measure;
}

TEST(MetricsViewTest, LookupIsCaseInsensitive) {
  MetricsView view("Sales");
  METRICSQL_ASSERT_OK(view.AddDimension(ColumnDimension("Region")));
  METRICSQL_ASSERT_OK(view.AddMeasure(SimpleMeasure("revenue", "SUM(amount)")));

  const DimensionDef* region = view.FindDimension("REGION");
  ASSERT_NE(region, nullptr);
  EXPECT_EQ(region->name, "Region");
  EXPECT_EQ(region->display_name, "Region");
  EXPECT_NE(view.FindMeasure("Revenue"), nullptr);
  EXPECT_EQ(view.FindMeasure("region"), nullptr);
  EXPECT_EQ(view.FindDimension("revenue"), nullptr);
}

TEST(MetricsViewTest, DisplayNameIsKept) {
  MetricsView view("Sales");
  DimensionDef dimension = ColumnDimension("region");
  dimension.display_name = "Sales region";
  METRICSQL_ASSERT_OK(view.AddDimension(dimension));
  EXPECT_EQ(view.dimensions()[0].display_name, "Sales region");
}

TEST(MetricsViewTest, NamesAreUniqueAcrossFieldKinds) {
  MetricsView view("Sales");
  METRICSQL_ASSERT_OK(view.AddDimension(ColumnDimension("region")));
  EXPECT_THAT(view.AddMeasure(SimpleMeasure("REGION", "COUNT(*)")),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Duplicate field name")));
  EXPECT_THAT(view.AddDimension(ColumnDimension("Region")),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(view.AddDimension(ColumnDimension("")),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("empty name")));
}

TEST(MetricsViewTest, DimensionNeedsColumnOrExpression) {
  MetricsView view("Sales");
  DimensionDef dimension;
  dimension.name = "region";
  EXPECT_THAT(view.AddDimension(dimension),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("exactly one of a column or an expression")));
  dimension.column = "region";
  dimension.expression = "upper(region)";
  EXPECT_THAT(view.AddDimension(dimension),
              StatusIs(absl::StatusCode::kInvalidArgument));
  dimension.column.clear();
  EXPECT_THAT(view.AddDimension(dimension), IsOk());
  EXPECT_TRUE(view.dimensions().back().column.empty());
}

TEST(MetricsViewTest, DerivedMeasuresReferenceSimpleMeasures) {
  MetricsView view("Sales");
  METRICSQL_ASSERT_OK(view.AddMeasure(SimpleMeasure("revenue", "SUM(amount)")));
  METRICSQL_ASSERT_OK(view.AddMeasure(SimpleMeasure("orders", "COUNT(*)")));
  EXPECT_THAT(view.AddMeasure(SimpleMeasure("empty", "")),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("has no expression")));

  MeasureDef average = SimpleMeasure("average", "revenue / orders");
  average.type = MeasureDef::DERIVED;
  EXPECT_THAT(view.AddMeasure(average),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("does not reference any measure")));

  average.referenced_measures = {"revenue", "refunds"};
  EXPECT_THAT(view.AddMeasure(average),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("non-simple measure refunds")));

  average.referenced_measures = {"revenue", "Orders"};
  METRICSQL_ASSERT_OK(view.AddMeasure(average));

  MeasureDef nested = SimpleMeasure("nested", "average * 2");
  nested.type = MeasureDef::DERIVED;
  nested.referenced_measures = {"average"};
  EXPECT_THAT(view.AddMeasure(nested),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_EQ(view.measures().size(), 3);
}

}  // namespace
}  // namespace metricsql
