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

#include "metricsql/public/validator.h"

#include <string>

#include "absl/base/attributes.h"
#include "absl/container/flat_hash_set.h"
#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "metricsql/base/status_macros.h"
#include "metricsql/common/errors.h"
#include "metricsql/common/time_util.h"

namespace metricsql {

namespace {

// Matches the limit of the expression translator.
constexpr int kMaxExpressionDepth = 256;

using NameCheck = absl::FunctionRef<absl::Status(absl::string_view)>;

bool IsListLiteral(const Expression& expr) {
  return expr.kind() == Expression::VALUE && expr.value().is_list();
}

class QueryValidator {
 public:
  QueryValidator(const Query& query, const MetricsView& view,
                 const SecurityPolicy* security_policy)
      : query_(query), view_(view), security_policy_(security_policy) {}

  absl::Status Validate();

 private:
  absl::Status CheckAccess(absl::string_view name,
                           absl::string_view field) const;
  absl::Status AddOutputName(absl::string_view name, absl::string_view field);
  bool IsOutputName(absl::string_view name) const {
    return output_names_.contains(absl::AsciiStrToLower(name));
  }

  absl::Status ValidateShape();
  absl::Status ValidateDimensions();
  absl::Status ValidateMeasures();
  absl::Status ValidateMeasure(const Measure& measure,
                               absl::string_view field);
  absl::Status ValidateFilters();
  absl::Status ValidateSort();
  absl::Status ValidateTime();

  // Names in a base filter: dimensions of the view, or its time column.
  absl::Status CheckFilterName(absl::string_view name,
                               absl::string_view field) const;

  absl::Status ValidateExpression(const Expression& expr,
                                  absl::string_view field, NameCheck check,
                                  int depth) const;
  absl::Status ValidateCondition(const Condition& condition,
                                 absl::string_view field, NameCheck check,
                                 int depth) const;
  absl::Status ValidateSubquery(const Subquery& subquery,
                                absl::string_view field, int depth) const;

  const Query& query_;
  const MetricsView& view_;
  const SecurityPolicy* security_policy_;

  // Lower-cased names of the requested dimensions and measures.
  absl::flat_hash_set<std::string> output_names_;
};

absl::Status QueryValidator::CheckAccess(absl::string_view name,
                                         absl::string_view field) const {
  if (security_policy_ != nullptr && !security_policy_->CanAccessField(name)) {
    return MakeAccessDeniedError(field)
           << "Access to " << name << " is not allowed";
  }
  return absl::OkStatus();
}

absl::Status QueryValidator::AddOutputName(absl::string_view name,
                                           absl::string_view field) {
  if (!output_names_.insert(absl::AsciiStrToLower(name)).second) {
    return MakeValidationError(field)
           << name << " is requested more than once";
  }
  return absl::OkStatus();
}

absl::Status QueryValidator::ValidateShape() {
  if (!query_.metrics_view.empty() &&
      !absl::EqualsIgnoreCase(query_.metrics_view, view_.name())) {
    return MakeValidationError("metrics_view")
           << "Query is for metrics view " << query_.metrics_view
           << " but was compiled against " << view_.name();
  }
  if (query_.rows) {
    if (!query_.dimensions.empty()) {
      return MakeValidationError("rows")
             << "rows cannot be combined with dimensions";
    }
    if (!query_.measures.empty()) {
      return MakeValidationError("rows")
             << "rows cannot be combined with measures";
    }
    if (query_.comparison_time_range.has_value()) {
      return MakeValidationError("rows")
             << "rows cannot be combined with a comparison time range";
    }
  }
  if (query_.having.has_value() && query_.measures.empty()) {
    return MakeValidationError("having") << "having requires measures";
  }
  if (query_.limit.has_value() && *query_.limit < 0) {
    return MakeValidationError("limit")
           << "limit must be non-negative, got " << *query_.limit;
  }
  if (query_.offset.has_value() && *query_.offset < 0) {
    return MakeValidationError("offset")
           << "offset must be non-negative, got " << *query_.offset;
  }
  return absl::OkStatus();
}

absl::Status QueryValidator::ValidateDimensions() {
  for (int i = 0; i < query_.dimensions.size(); ++i) {
    const Dimension& dimension = query_.dimensions[i];
    const std::string field = absl::StrCat("dimensions[", i, "]");
    const DimensionDef* def = view_.FindDimension(dimension.name);
    if (def == nullptr) {
      return MakeValidationError(field)
             << "Dimension " << dimension.name << " not found in metrics view "
             << view_.name();
    }
    METRICSQL_RETURN_IF_ERROR(CheckAccess(def->name, field));
    if (dimension.grain != TimeGrain::kUnspecified &&
        def->type != DimensionDef::TIMESTAMP) {
      return MakeValidationError(field)
             << "Time grain " << TimeGrainName(dimension.grain)
             << " applied to dimension " << def->name
             << ", which is not a timestamp";
    }
    METRICSQL_RETURN_IF_ERROR(AddOutputName(def->name, field));
  }
  return absl::OkStatus();
}

absl::Status QueryValidator::ValidateMeasure(const Measure& measure,
                                             absl::string_view field) {
  if (measure.name.empty()) {
    return MakeValidationError(field) << "Measure has no name";
  }
  if (!measure.compute.has_value()) {
    const MeasureDef* def = view_.FindMeasure(measure.name);
    if (def == nullptr) {
      return MakeValidationError(field)
             << "Measure " << measure.name << " not found in metrics view "
             << view_.name();
    }
    METRICSQL_RETURN_IF_ERROR(CheckAccess(def->name, field));
    return AddOutputName(def->name, field);
  }

  if (view_.FindDimension(measure.name) != nullptr ||
      view_.FindMeasure(measure.name) != nullptr) {
    return MakeValidationError(field)
           << "Computed measure " << measure.name
           << " has the name of a field of metrics view " << view_.name();
  }
  const MeasureCompute& compute = *measure.compute;
  switch (compute.kind) {
    case MeasureCompute::COUNT:
      break;
    case MeasureCompute::COUNT_DISTINCT: {
      const DimensionDef* target = view_.FindDimension(compute.target);
      if (target == nullptr) {
        return MakeValidationError(field)
               << "count_distinct of " << measure.name << " targets "
               << compute.target << ", which is not a dimension";
      }
      METRICSQL_RETURN_IF_ERROR(CheckAccess(target->name, field));
      break;
    }
    case MeasureCompute::COMPARISON_VALUE:
    case MeasureCompute::COMPARISON_DELTA:
    case MeasureCompute::COMPARISON_RATIO:
      if (!query_.comparison_time_range.has_value()) {
        return MakeValidationError(field)
               << "Comparison measure " << measure.name
               << " requires a comparison time range";
      }
      ABSL_FALLTHROUGH_INTENDED;
    case MeasureCompute::PERCENT_OF_TOTAL: {
      const MeasureDef* target = view_.FindMeasure(compute.target);
      if (target == nullptr) {
        return MakeValidationError(field)
               << "Measure " << measure.name << " targets " << compute.target
               << ", which is not a measure of metrics view " << view_.name();
      }
      METRICSQL_RETURN_IF_ERROR(CheckAccess(target->name, field));
      break;
    }
  }
  return AddOutputName(measure.name, field);
}

absl::Status QueryValidator::ValidateMeasures() {
  for (int i = 0; i < query_.measures.size(); ++i) {
    METRICSQL_RETURN_IF_ERROR(ValidateMeasure(
        query_.measures[i], absl::StrCat("measures[", i, "]")));
  }
  return absl::OkStatus();
}

absl::Status QueryValidator::CheckFilterName(absl::string_view name,
                                             absl::string_view field) const {
  if (const DimensionDef* def = view_.FindDimension(name)) {
    return CheckAccess(def->name, field);
  }
  if (!view_.time_dimension().empty() && name == view_.time_dimension()) {
    return CheckAccess(name, field);
  }
  return MakeValidationError(field)
         << name << " is not a dimension of metrics view " << view_.name();
}

absl::Status QueryValidator::ValidateFilters() {
  if (query_.where.has_value()) {
    auto check = [this](absl::string_view name) {
      return CheckFilterName(name, "where");
    };
    METRICSQL_RETURN_IF_ERROR(
        ValidateExpression(*query_.where, "where", check, /*depth=*/0));
  }
  if (query_.having.has_value()) {
    auto check = [this](absl::string_view name) -> absl::Status {
      if (!IsOutputName(name)) {
        return MakeValidationError("having")
               << name << " is not a requested dimension or measure";
      }
      return absl::OkStatus();
    };
    METRICSQL_RETURN_IF_ERROR(
        ValidateExpression(*query_.having, "having", check, /*depth=*/0));
  }
  for (int i = 0; i < query_.pivot_on.size(); ++i) {
    if (!IsOutputName(query_.pivot_on[i])) {
      return MakeValidationError(absl::StrCat("pivot_on[", i, "]"))
             << query_.pivot_on[i]
             << " is not a requested dimension or measure";
    }
  }
  return absl::OkStatus();
}

absl::Status QueryValidator::ValidateSort() {
  for (int i = 0; i < query_.sort.size(); ++i) {
    const std::string field = absl::StrCat("sort[", i, "]");
    const std::string& name = query_.sort[i].name;
    if (query_.rows) {
      // Raw rows are sorted by columns of the base table.
      METRICSQL_RETURN_IF_ERROR(CheckFilterName(name, field));
    } else if (!IsOutputName(name)) {
      return MakeValidationError(field)
             << "Sort field " << name
             << " is not a requested dimension or measure";
    }
  }
  return absl::OkStatus();
}

absl::Status QueryValidator::ValidateTime() {
  if (!query_.time_zone.empty()) {
    absl::TimeZone zone;
    if (!FindTimeZoneByName(query_.time_zone, &zone).ok()) {
      return MakeValidationError("time_zone")
             << "Unknown time zone " << query_.time_zone;
    }
  }
  if ((query_.time_range.has_value() ||
       query_.comparison_time_range.has_value()) &&
      view_.time_dimension().empty()) {
    return MakeValidationError("time_range")
           << "Metrics view " << view_.name() << " has no time dimension";
  }
  for (const auto* range :
       {&query_.time_range, &query_.comparison_time_range}) {
    if (range->has_value() && (*range)->start.has_value() &&
        (*range)->end.has_value() && *(*range)->start > *(*range)->end) {
      return MakeValidationError(range == &query_.time_range
                                     ? "time_range"
                                     : "comparison_time_range")
             << "Time range ends before it starts";
    }
  }
  return absl::OkStatus();
}

absl::Status QueryValidator::ValidateExpression(const Expression& expr,
                                                absl::string_view field,
                                                NameCheck check,
                                                int depth) const {
  if (depth > kMaxExpressionDepth) {
    return MakeValidationError(field)
           << "Expression nesting exceeds " << kMaxExpressionDepth
           << " levels";
  }
  switch (expr.kind()) {
    case Expression::NAME:
      return check(expr.name());
    case Expression::VALUE:
      return absl::OkStatus();
    case Expression::CONDITION:
      return ValidateCondition(expr.condition(), field, check, depth);
    case Expression::SUBQUERY:
      return MakeValidationError(field)
             << "A subquery may only be the second operand of in or nin";
    case Expression::EMPTY:
      break;
  }
  return MakeValidationError(field)
         << "Expression has none of name, value, condition or subquery set";
}

absl::Status QueryValidator::ValidateCondition(const Condition& condition,
                                               absl::string_view field,
                                               NameCheck check,
                                               int depth) const {
  const absl::string_view op = OperatorName(condition.op);
  if (IsLogicalOperator(condition.op)) {
    if (condition.operands.size() < 2) {
      return MakeValidationError(field)
             << "Operator " << op << " requires at least 2 operands, got "
             << condition.operands.size();
    }
    for (const Expression& operand : condition.operands) {
      METRICSQL_RETURN_IF_ERROR(
          ValidateExpression(operand, field, check, depth + 1));
    }
    return absl::OkStatus();
  }

  if (condition.operands.size() != 2) {
    return MakeValidationError(field)
           << "Operator " << op << " requires 2 operands, got "
           << condition.operands.size();
  }
  const Expression& lhs = condition.operands[0];
  const Expression& rhs = condition.operands[1];
  if (IsListLiteral(lhs)) {
    return MakeValidationError(field)
           << "The first operand of " << op << " cannot be a list";
  }
  METRICSQL_RETURN_IF_ERROR(ValidateExpression(lhs, field, check, depth + 1));

  if (IsListOperator(condition.op)) {
    if (rhs.kind() == Expression::SUBQUERY) {
      return ValidateSubquery(rhs.subquery(), field, depth + 1);
    }
    if (!IsListLiteral(rhs)) {
      return MakeValidationError(field)
             << "The second operand of " << op
             << " must be a list or a subquery";
    }
    for (const Value& element : rhs.value().elements()) {
      if (element.is_list()) {
        return MakeValidationError(field)
               << "Nested list in operand of " << op;
      }
    }
    return absl::OkStatus();
  }
  if (IsListLiteral(rhs)) {
    return MakeValidationError(field)
           << "Operator " << op << " cannot compare with a list";
  }
  return ValidateExpression(rhs, field, check, depth + 1);
}

absl::Status QueryValidator::ValidateSubquery(const Subquery& subquery,
                                              absl::string_view field,
                                              int depth) const {
  const DimensionDef* dimension = view_.FindDimension(subquery.dimension);
  if (dimension == nullptr) {
    return MakeValidationError(field)
           << "Subquery dimension " << subquery.dimension
           << " not found in metrics view " << view_.name();
  }
  METRICSQL_RETURN_IF_ERROR(CheckAccess(dimension->name, field));

  absl::flat_hash_set<std::string> names = {
      absl::AsciiStrToLower(dimension->name)};
  for (const std::string& name : subquery.measures) {
    const MeasureDef* measure = view_.FindMeasure(name);
    if (measure == nullptr) {
      return MakeValidationError(field)
             << "Subquery measure " << name << " not found in metrics view "
             << view_.name();
    }
    METRICSQL_RETURN_IF_ERROR(CheckAccess(measure->name, field));
    names.insert(absl::AsciiStrToLower(measure->name));
  }

  if (subquery.where != nullptr) {
    auto check = [this, field](absl::string_view name) {
      return CheckFilterName(name, field);
    };
    METRICSQL_RETURN_IF_ERROR(
        ValidateExpression(*subquery.where, field, check, depth + 1));
  }
  if (subquery.having != nullptr) {
    if (subquery.measures.empty()) {
      return MakeValidationError(field)
             << "Subquery having requires measures";
    }
    auto check = [&names, field](absl::string_view name) -> absl::Status {
      if (!names.contains(absl::AsciiStrToLower(name))) {
        return MakeValidationError(field)
               << name << " is not selected by the subquery";
      }
      return absl::OkStatus();
    };
    METRICSQL_RETURN_IF_ERROR(
        ValidateExpression(*subquery.having, field, check, depth + 1));
  }
  return absl::OkStatus();
}

absl::Status QueryValidator::Validate() {
  METRICSQL_RETURN_IF_ERROR(ValidateShape());
  METRICSQL_RETURN_IF_ERROR(ValidateDimensions());
  METRICSQL_RETURN_IF_ERROR(ValidateMeasures());
  METRICSQL_RETURN_IF_ERROR(ValidateFilters());
  METRICSQL_RETURN_IF_ERROR(ValidateSort());
  return ValidateTime();
}

}  // namespace

absl::Status ValidateQuery(const Query& query, const MetricsView& view,
                           const SecurityPolicy* security_policy) {
  return QueryValidator(query, view, security_policy).Validate();
}

}  // namespace metricsql
