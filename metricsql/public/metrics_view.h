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

#ifndef METRICSQL_PUBLIC_METRICS_VIEW_H_
#define METRICSQL_PUBLIC_METRICS_VIEW_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace metricsql {

// A dimension of a metrics view. Exactly one of `column` and `expression` is
// set: a column is escaped by the dialect, an expression is used verbatim.
struct DimensionDef {
  enum Type {
    STRING,
    NUMERIC,
    BOOLEAN,
    TIMESTAMP,
  };

  std::string name;
  std::string display_name;
  std::string column;
  std::string expression;
  Type type = STRING;
};

// A measure of a metrics view. SIMPLE measures are an aggregate expression
// over the base table. DERIVED measures are an expression over other
// measures, listed in `referenced_measures` and referred to by name.
struct MeasureDef {
  enum Type {
    SIMPLE,
    DERIVED,
  };

  std::string name;
  std::string display_name;
  std::string expression;
  Type type = SIMPLE;
  std::vector<std::string> referenced_measures;
};

// The schema binding dimension and measure names to SQL over one base
// table. Populated once when the schema is loaded and read-only afterwards;
// const methods may be called concurrently.
//
// Names are case-insensitive; a dimension and a measure may not share a name.
class MetricsView {
 public:
  explicit MetricsView(absl::string_view name) : name_(name) {}
  MetricsView(const MetricsView&) = delete;
  MetricsView& operator=(const MetricsView&) = delete;

  const std::string& name() const { return name_; }

  // Optionally qualified table name, e.g. {"analytics", "events"}. Each part
  // is escaped separately.
  const std::vector<std::string>& table() const { return table_; }
  void set_table(std::vector<std::string> table) { table_ = std::move(table); }

  // The timestamp column time ranges are applied to. Empty when the view has
  // no time dimension; queries with a time range are then rejected.
  const std::string& time_dimension() const { return time_dimension_; }
  void set_time_dimension(absl::string_view column) {
    time_dimension_ = std::string(column);
  }

  // 1 = Monday ... 7 = Sunday. 0 means the compiler options decide.
  int first_day_of_week() const { return first_day_of_week_; }
  void set_first_day_of_week(int day) { first_day_of_week_ = day; }

  // 1 = January ... 12 = December. 0 means the compiler options decide.
  int first_month_of_year() const { return first_month_of_year_; }
  void set_first_month_of_year(int month) { first_month_of_year_ = month; }

  // Returns an error if the name is taken or the definition is malformed.
  absl::Status AddDimension(DimensionDef dimension);
  absl::Status AddMeasure(MeasureDef measure);

  // Returns nullptr if not found.
  const DimensionDef* FindDimension(absl::string_view name) const;
  const MeasureDef* FindMeasure(absl::string_view name) const;

  const std::vector<DimensionDef>& dimensions() const { return dimensions_; }
  const std::vector<MeasureDef>& measures() const { return measures_; }

 private:
  absl::Status CheckNameAvailable(absl::string_view name) const;

  const std::string name_;
  std::vector<std::string> table_;
  std::string time_dimension_;
  int first_day_of_week_ = 0;
  int first_month_of_year_ = 0;

  std::vector<DimensionDef> dimensions_;
  std::vector<MeasureDef> measures_;
  // Lower-cased name to index.
  absl::flat_hash_map<std::string, int> dimensions_by_name_;
  absl::flat_hash_map<std::string, int> measures_by_name_;
};

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_METRICS_VIEW_H_
