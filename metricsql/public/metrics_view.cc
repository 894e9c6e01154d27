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
#include <utility>

#include "absl/strings/ascii.h"
#include "metricsql/base/status_builder.h"
#include "metricsql/base/status_macros.h"

namespace metricsql {

absl::Status MetricsView::CheckNameAvailable(absl::string_view name) const {
  if (name.empty()) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "Metrics view " << name_ << " has a field with an empty name";
  }
  const std::string key = absl::AsciiStrToLower(name);
  if (dimensions_by_name_.contains(key) || measures_by_name_.contains(key)) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "Duplicate field name " << name << " in metrics view " << name_;
  }
  return absl::OkStatus();
}

absl::Status MetricsView::AddDimension(DimensionDef dimension) {
  METRICSQL_RETURN_IF_ERROR(CheckNameAvailable(dimension.name));
  if (dimension.column.empty() == dimension.expression.empty()) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "Dimension " << dimension.name
           << " must have exactly one of a column or an expression";
  }
  if (dimension.display_name.empty()) {
    dimension.display_name = dimension.name;
  }
  dimensions_by_name_.emplace(absl::AsciiStrToLower(dimension.name),
                              static_cast<int>(dimensions_.size()));
  dimensions_.push_back(std::move(dimension));
  return absl::OkStatus();
}

absl::Status MetricsView::AddMeasure(MeasureDef measure) {
  METRICSQL_RETURN_IF_ERROR(CheckNameAvailable(measure.name));
  if (measure.expression.empty()) {
    return ::metricsql_base::InvalidArgumentErrorBuilder()
           << "Measure " << measure.name << " has no expression";
  }
  if (measure.type == MeasureDef::DERIVED) {
    if (measure.referenced_measures.empty()) {
      return ::metricsql_base::InvalidArgumentErrorBuilder()
             << "Derived measure " << measure.name
             << " does not reference any measure";
    }
    // Referenced measures must already be defined and must be simple, so
    // derived measures cannot form cycles.
    for (const std::string& referenced : measure.referenced_measures) {
      const MeasureDef* def = FindMeasure(referenced);
      if (def == nullptr || def->type != MeasureDef::SIMPLE) {
        return ::metricsql_base::InvalidArgumentErrorBuilder()
               << "Derived measure " << measure.name
               << " references unknown or non-simple measure " << referenced;
      }
    }
  }
  if (measure.display_name.empty()) {
    measure.display_name = measure.name;
  }
  measures_by_name_.emplace(absl::AsciiStrToLower(measure.name),
                            static_cast<int>(measures_.size()));
  measures_.push_back(std::move(measure));
  return absl::OkStatus();
}

const DimensionDef* MetricsView::FindDimension(absl::string_view name) const {
  auto it = dimensions_by_name_.find(absl::AsciiStrToLower(name));
  if (it == dimensions_by_name_.end()) return nullptr;
  return &dimensions_[it->second];
}

const MeasureDef* MetricsView::FindMeasure(absl::string_view name) const {
  auto it = measures_by_name_.find(absl::AsciiStrToLower(name));
  if (it == measures_by_name_.end()) return nullptr;
  return &measures_[it->second];
}

}  // namespace metricsql
