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

#include "metricsql/planner/plan_builder.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/base/status_macros.h"
#include "metricsql/common/errors.h"
#include "metricsql/planner/expression_translator.h"
#include "metricsql/planner/sql_emitter.h"

namespace metricsql {

namespace {

constexpr absl::string_view kRootAlias = "base";
constexpr absl::string_view kCurrentAlias = "base_current";
constexpr absl::string_view kComparisonAlias = "base_comparison";
constexpr absl::string_view kInnerSuffix = "_inner";

// How a requested measure is computed from the base measures of a period.
enum class MeasureRole {
  // A schema measure, COUNT(*) or COUNT(DISTINCT ...), output as is.
  kBase,
  kPercentOfTotal,
  kComparisonValue,
  kComparisonDelta,
  kComparisonRatio,
};

struct RequestedMeasure {
  std::string name;
  std::string display_name;
  MeasureRole role = MeasureRole::kBase;
  // The base measure the value is computed from. Equal to `name` for kBase.
  std::string target;
  std::optional<double> total;
};

// A measure computed by the period blocks, by name.
struct BaseMeasure {
  std::string name;
  std::string display_name;
  // Aggregate SQL, or for derived measures an expression over other base
  // measures referenced by name.
  std::string sql;
  bool derived = false;
};

// Builds the plan tree of one query. Short lived; created per Build() call
// and per subquery.
class PlanTreeBuilder : public TranslationScope {
 public:
  PlanTreeBuilder(const MetricsView& view,
                  const SecurityPolicy* security_policy,
                  const Dialect& dialect, const CalendarSettings& calendar,
                  const Query& query, bool dimensions_only)
      : view_(view),
        security_policy_(security_policy),
        dialect_(dialect),
        calendar_(calendar),
        query_(query),
        dimensions_only_(dimensions_only) {}

  absl::StatusOr<PlanTree> Build();

  // Names in base filters are dimensions, or the time dimension column.
  absl::StatusOr<SqlFragment> ResolveName(
      absl::string_view name) const override;

  absl::StatusOr<SqlFragment> CompileSubquery(
      const Subquery& subquery) const override;

 private:
  // Resolves names to the select list of the root block. Used for HAVING.
  class RootScope : public TranslationScope {
   public:
    RootScope(const PlanTreeBuilder* builder, const SelectBlock* root)
        : builder_(builder), root_(root) {}

    absl::StatusOr<SqlFragment> ResolveName(
        absl::string_view name) const override;
    absl::StatusOr<SqlFragment> CompileSubquery(
        const Subquery& subquery) const override {
      return builder_->CompileSubquery(subquery);
    }

   private:
    const PlanTreeBuilder* builder_;
    const SelectBlock* root_;
  };

  absl::StatusOr<SqlFragment> DimensionSql(const DimensionDef& dimension,
                                           TimeGrain grain) const;
  // The canonical field name `name` is selected under.
  std::string CanonicalName(absl::string_view name) const;

  absl::Status ResolveMeasures();
  absl::Status AddBaseMeasure(const MeasureDef& measure);
  absl::Status AddComputedBaseMeasure(const Measure& measure);

  // The base filter AND'ed with the bounds of `range`.
  absl::StatusOr<SqlFragment> PeriodFilter(
      const std::optional<TimeRange>& range) const;

  // Adds the block(s) computing every base measure over `range`, grouped by
  // the requested dimensions, and returns the block selecting them by name.
  absl::StatusOr<SelectBlock*> BuildPeriod(
      absl::string_view alias, const std::optional<TimeRange>& range);

  absl::Status BuildRawRows(SelectBlock* root);
  absl::Status BuildSinglePeriodRoot(SelectBlock* root);
  absl::Status BuildComparisonRoot(SelectBlock* root);
  absl::Status AttachHavingSortAndLimit(SelectBlock* root);

  const MetricsView& view_;
  const SecurityPolicy* security_policy_;
  const Dialect& dialect_;
  const CalendarSettings& calendar_;
  const Query& query_;
  // Subqueries select only their dimensions.
  const bool dimensions_only_;

  PlanTree tree_;
  SqlFragment base_filter_;
  std::vector<RequestedMeasure> requested_;
  std::vector<BaseMeasure> base_measures_;
  absl::flat_hash_set<std::string> base_measure_names_;
};

absl::StatusOr<SqlFragment> PlanTreeBuilder::ResolveName(
    absl::string_view name) const {
  if (const DimensionDef* dimension = view_.FindDimension(name);
      dimension != nullptr) {
    return DimensionSql(*dimension, TimeGrain::kUnspecified);
  }
  if (!view_.time_dimension().empty() && name == view_.time_dimension()) {
    return SqlFragment(dialect_.EscapeIdentifier(name));
  }
  return MakeCompileInvariantError()
         << "Filter references " << name
         << ", which is not a dimension of metrics view " << view_.name();
}

absl::StatusOr<SqlFragment> PlanTreeBuilder::RootScope::ResolveName(
    absl::string_view name) const {
  const FieldNode* field = root_->FindField(builder_->CanonicalName(name));
  if (field == nullptr) {
    return MakeCompileInvariantError()
           << "Having references " << name << ", which is not selected";
  }
  return field->expr;
}

absl::StatusOr<SqlFragment> PlanTreeBuilder::CompileSubquery(
    const Subquery& subquery) const {
  Query inner;
  inner.metrics_view = query_.metrics_view;
  inner.dimensions.push_back(Dimension{subquery.dimension});
  for (const std::string& measure : subquery.measures) {
    inner.measures.push_back(Measure{measure});
  }
  if (subquery.where != nullptr) inner.where = *subquery.where;
  if (subquery.having != nullptr) inner.having = *subquery.having;
  // The subquery filters the same period as the enclosing query.
  inner.time_range = query_.time_range;
  inner.time_zone = query_.time_zone;

  PlanTreeBuilder builder(view_, security_policy_, dialect_, calendar_, inner,
                          /*dimensions_only=*/true);
  METRICSQL_ASSIGN_OR_RETURN(PlanTree tree, builder.Build());
  return SqlEmitter(&dialect_).Emit(tree);
}

absl::StatusOr<SqlFragment> PlanTreeBuilder::DimensionSql(
    const DimensionDef& dimension, TimeGrain grain) const {
  std::string sql = dimension.column.empty()
                        ? absl::StrCat("(", dimension.expression, ")")
                        : dialect_.EscapeIdentifier(dimension.column);
  if (grain == TimeGrain::kUnspecified) {
    return SqlFragment(std::move(sql));
  }
  DateTruncSpec spec;
  spec.expr = std::move(sql);
  spec.grain = grain;
  spec.time_zone = calendar_.time_zone;
  spec.first_day_of_week = calendar_.first_day_of_week;
  spec.first_month_of_year = calendar_.first_month_of_year;
  METRICSQL_ASSIGN_OR_RETURN(std::string truncated,
                             dialect_.DateTruncExpr(spec));
  return SqlFragment(std::move(truncated));
}

std::string PlanTreeBuilder::CanonicalName(absl::string_view name) const {
  if (const DimensionDef* dimension = view_.FindDimension(name)) {
    return dimension->name;
  }
  for (const Measure& measure : query_.measures) {
    if (measure.compute.has_value() &&
        absl::EqualsIgnoreCase(measure.name, name)) {
      return measure.name;
    }
  }
  if (const MeasureDef* measure = view_.FindMeasure(name)) {
    return measure->name;
  }
  return std::string(name);
}

absl::Status PlanTreeBuilder::AddBaseMeasure(const MeasureDef& measure) {
  if (base_measure_names_.contains(measure.name)) {
    return absl::OkStatus();
  }
  if (measure.type == MeasureDef::DERIVED) {
    for (const std::string& referenced : measure.referenced_measures) {
      const MeasureDef* def = view_.FindMeasure(referenced);
      METRICSQL_RET_CHECK(def != nullptr)
          << "Derived measure " << measure.name << " references unknown "
          << referenced;
      METRICSQL_RETURN_IF_ERROR(AddBaseMeasure(*def));
    }
  }
  base_measure_names_.insert(measure.name);
  base_measures_.push_back(BaseMeasure{measure.name, measure.display_name,
                                       measure.expression,
                                       measure.type == MeasureDef::DERIVED});
  return absl::OkStatus();
}

absl::Status PlanTreeBuilder::AddComputedBaseMeasure(const Measure& measure) {
  std::string sql;
  if (measure.compute->kind == MeasureCompute::COUNT) {
    sql = "COUNT(*)";
  } else {
    const DimensionDef* dimension =
        view_.FindDimension(measure.compute->target);
    if (dimension == nullptr) {
      return MakeCompileInvariantError()
             << "count_distinct target " << measure.compute->target
             << " is not a dimension";
    }
    METRICSQL_ASSIGN_OR_RETURN(
        SqlFragment expr, DimensionSql(*dimension, TimeGrain::kUnspecified));
    sql = absl::StrCat("COUNT(DISTINCT ", expr.sql, ")");
  }
  METRICSQL_RET_CHECK(base_measure_names_.insert(measure.name).second)
      << "Duplicate measure " << measure.name;
  base_measures_.push_back(
      BaseMeasure{measure.name, measure.name, std::move(sql), false});
  return absl::OkStatus();
}

absl::Status PlanTreeBuilder::ResolveMeasures() {
  for (const Measure& measure : query_.measures) {
    RequestedMeasure requested;
    requested.name = measure.name;
    requested.display_name = measure.name;
    requested.target = measure.name;

    if (!measure.compute.has_value()) {
      const MeasureDef* def = view_.FindMeasure(measure.name);
      if (def == nullptr) {
        return MakeCompileInvariantError()
               << "Unknown measure " << measure.name << " in metrics view "
               << view_.name();
      }
      METRICSQL_RETURN_IF_ERROR(AddBaseMeasure(*def));
      requested.name = def->name;
      requested.target = def->name;
      requested.display_name = def->display_name;
      requested_.push_back(std::move(requested));
      continue;
    }

    const MeasureCompute& compute = *measure.compute;
    switch (compute.kind) {
      case MeasureCompute::COUNT:
      case MeasureCompute::COUNT_DISTINCT:
        METRICSQL_RETURN_IF_ERROR(AddComputedBaseMeasure(measure));
        requested_.push_back(std::move(requested));
        continue;
      case MeasureCompute::PERCENT_OF_TOTAL:
        requested.role = MeasureRole::kPercentOfTotal;
        requested.total = compute.total;
        if (!compute.total.has_value()) {
          return MakeCompileInvariantError()
                 << "The grand total of percent-of-total measure "
                 << measure.name << " was not resolved";
        }
        break;
      case MeasureCompute::COMPARISON_VALUE:
        requested.role = MeasureRole::kComparisonValue;
        break;
      case MeasureCompute::COMPARISON_DELTA:
        requested.role = MeasureRole::kComparisonDelta;
        break;
      case MeasureCompute::COMPARISON_RATIO:
        requested.role = MeasureRole::kComparisonRatio;
        break;
    }
    const MeasureDef* target = view_.FindMeasure(compute.target);
    if (target == nullptr) {
      return MakeCompileInvariantError()
             << "Measure " << measure.name << " targets unknown measure "
             << compute.target;
    }
    METRICSQL_RETURN_IF_ERROR(AddBaseMeasure(*target));
    requested.target = target->name;
    requested_.push_back(std::move(requested));
  }
  return absl::OkStatus();
}

absl::StatusOr<SqlFragment> PlanTreeBuilder::PeriodFilter(
    const std::optional<TimeRange>& range) const {
  std::vector<SqlFragment> conjuncts;
  if (!base_filter_.empty()) {
    conjuncts.push_back(base_filter_);
  }
  if (range.has_value()) {
    METRICSQL_RET_CHECK(range->IsAbsolute())
        << "Time range was not resolved before plan building";
  }
  if (range.has_value() &&
      (range->start.has_value() || range->end.has_value())) {
    if (view_.time_dimension().empty()) {
      return MakeCompileInvariantError()
             << "Metrics view " << view_.name() << " has no time dimension";
    }
    const std::string column =
        dialect_.EscapeIdentifier(view_.time_dimension());
    if (range->start.has_value()) {
      conjuncts.push_back(SqlFragment(absl::StrCat(column, " >= ?"),
                                      {Value::Timestamp(*range->start)}));
    }
    if (range->end.has_value()) {
      conjuncts.push_back(SqlFragment(absl::StrCat(column, " < ?"),
                                      {Value::Timestamp(*range->end)}));
    }
  }
  SqlFragment filter;
  for (int i = 0; i < conjuncts.size(); ++i) {
    if (i > 0) filter.Append(" AND ");
    filter.Append(conjuncts[i]);
  }
  return filter;
}

absl::StatusOr<SelectBlock*> PlanTreeBuilder::BuildPeriod(
    absl::string_view alias, const std::optional<TimeRange>& range) {
  bool has_derived = false;
  for (const BaseMeasure& measure : base_measures_) {
    has_derived |= measure.derived;
  }
  const std::string aggregate_alias =
      has_derived ? absl::StrCat(alias, kInnerSuffix) : std::string(alias);

  // The aggregating block.
  SelectBlock* aggregate = nullptr;
  SelectBlock* period = nullptr;
  if (has_derived) {
    METRICSQL_ASSIGN_OR_RETURN(period, tree_.AddBlock(alias));
    METRICSQL_ASSIGN_OR_RETURN(aggregate, tree_.AddBlock(aggregate_alias));
  } else {
    METRICSQL_ASSIGN_OR_RETURN(aggregate, tree_.AddBlock(alias));
    period = aggregate;
  }

  aggregate->table = dialect_.EscapeQualifiedName(view_.table());
  METRICSQL_ASSIGN_OR_RETURN(aggregate->where, PeriodFilter(range));
  for (const Dimension& requested : query_.dimensions) {
    const DimensionDef* dimension = view_.FindDimension(requested.name);
    if (dimension == nullptr) {
      return MakeCompileInvariantError()
             << "Unknown dimension " << requested.name << " in metrics view "
             << view_.name();
    }
    FieldNode field;
    field.name = dimension->name;
    field.display_name = dimension->display_name;
    METRICSQL_ASSIGN_OR_RETURN(field.expr,
                               DimensionSql(*dimension, requested.grain));
    aggregate->dimensions.push_back(std::move(field));
  }
  aggregate->grouped = !aggregate->dimensions.empty();
  for (const BaseMeasure& measure : base_measures_) {
    if (measure.derived) continue;
    aggregate->measures.push_back(FieldNode{
        measure.name, measure.display_name, SqlFragment(measure.sql)});
  }
  if (!has_derived) {
    return period;
  }

  // Derived measures refer to the aggregated measures by name, which resolve
  // to the columns of the single child.
  period->from_alias = aggregate_alias;
  for (const FieldNode& dimension : aggregate->dimensions) {
    FieldNode field;
    field.name = dimension.name;
    field.display_name = dimension.display_name;
    field.expr =
        SqlFragment(dialect_.QualifiedColumn(aggregate_alias, dimension.name));
    field.source_alias = aggregate_alias;
    field.source_field = dimension.name;
    period->dimensions.push_back(std::move(field));
  }
  for (const BaseMeasure& measure : base_measures_) {
    FieldNode field;
    field.name = measure.name;
    field.display_name = measure.display_name;
    if (measure.derived) {
      field.expr = SqlFragment(absl::StrCat("(", measure.sql, ")"));
    } else {
      field.expr =
          SqlFragment(dialect_.QualifiedColumn(aggregate_alias, measure.name));
      field.source_alias = aggregate_alias;
      field.source_field = measure.name;
    }
    period->measures.push_back(std::move(field));
  }
  return period;
}

absl::Status PlanTreeBuilder::BuildRawRows(SelectBlock* root) {
  root->select_star = true;
  root->table = dialect_.EscapeQualifiedName(view_.table());
  METRICSQL_ASSIGN_OR_RETURN(root->where, PeriodFilter(query_.time_range));
  for (const Sort& sort : query_.sort) {
    OrderField order;
    order.desc = sort.desc;
    METRICSQL_ASSIGN_OR_RETURN(order.expr, ResolveName(sort.name));
    root->order.push_back(std::move(order));
  }
  root->limit = query_.limit;
  root->offset = query_.offset;
  return absl::OkStatus();
}

absl::Status PlanTreeBuilder::BuildSinglePeriodRoot(SelectBlock* root) {
  // `root` selects every base measure; narrow it to the requested ones.
  std::vector<FieldNode> base = std::move(root->measures);
  root->measures.clear();
  auto find_base = [&base](absl::string_view name) -> const FieldNode* {
    for (const FieldNode& field : base) {
      if (field.name == name) return &field;
    }
    return nullptr;
  };

  for (const RequestedMeasure& requested : requested_) {
    const FieldNode* target = find_base(requested.target);
    METRICSQL_RET_CHECK(target != nullptr)
        << "Base measure " << requested.target << " was not built";
    FieldNode field = *target;
    field.name = requested.name;
    field.display_name = requested.display_name;
    if (requested.role == MeasureRole::kPercentOfTotal) {
      field.expr = SqlFragment("(");
      field.expr.Append(target->expr);
      field.expr.Append(") / ? * 100");
      // A zero total yields NULL instead of a division error.
      field.expr.args.push_back(*requested.total == 0
                                    ? Value::Null()
                                    : Value::Double(*requested.total));
      field.source_alias.clear();
      field.source_field.clear();
    } else {
      METRICSQL_RET_CHECK(requested.role == MeasureRole::kBase)
          << "Comparison measure " << requested.name
          << " without a comparison time range";
    }
    root->measures.push_back(std::move(field));
  }
  return absl::OkStatus();
}

absl::Status PlanTreeBuilder::BuildComparisonRoot(SelectBlock* root) {
  for (const Dimension& dimension : query_.dimensions) {
    if (dimension.grain != TimeGrain::kUnspecified) {
      return MakeUnsupportedFeatureError()
             << "Comparison measures cannot be grouped by the time grain of "
             << dimension.name;
    }
  }
  METRICSQL_ASSIGN_OR_RETURN(SelectBlock * current,
                             BuildPeriod(kCurrentAlias, query_.time_range));
  METRICSQL_ASSIGN_OR_RETURN(
      SelectBlock * comparison,
      BuildPeriod(kComparisonAlias, query_.comparison_time_range));

  root->from_alias = current->alias;
  JoinChild join;
  join.alias = comparison->alias;
  join.kind = JoinKind::kFullOuter;
  for (int i = 0; i < current->dimensions.size(); ++i) {
    const std::string& name = current->dimensions[i].name;
    const std::string lhs = dialect_.QualifiedColumn(current->alias, name);
    const std::string rhs = dialect_.QualifiedColumn(comparison->alias, name);
    if (i > 0) join.on.Append(" AND ");
    join.on.Append(dialect_.JoinOnExpr(lhs, rhs));

    FieldNode field;
    field.name = name;
    field.display_name = current->dimensions[i].display_name;
    field.expr = SqlFragment(absl::StrCat("COALESCE(", lhs, ", ", rhs, ")"));
    root->dimensions.push_back(std::move(field));
  }
  root->joins.push_back(std::move(join));

  for (const RequestedMeasure& requested : requested_) {
    const std::string base =
        dialect_.QualifiedColumn(current->alias, requested.target);
    const std::string previous =
        dialect_.QualifiedColumn(comparison->alias, requested.target);
    FieldNode field;
    field.name = requested.name;
    field.display_name = requested.display_name;
    switch (requested.role) {
      case MeasureRole::kBase:
        field.expr = SqlFragment(base);
        field.source_alias = current->alias;
        field.source_field = requested.target;
        break;
      case MeasureRole::kComparisonValue:
        field.expr = SqlFragment(previous);
        field.source_alias = comparison->alias;
        field.source_field = requested.target;
        break;
      case MeasureRole::kComparisonDelta:
        field.expr = SqlFragment(absl::StrCat(base, " - ", previous));
        break;
      case MeasureRole::kComparisonRatio:
        field.expr = SqlFragment(absl::StrCat("(", base, " - ", previous,
                                              ") / NULLIF(", previous, ", 0)"));
        break;
      case MeasureRole::kPercentOfTotal:
        field.expr = SqlFragment(
            absl::StrCat(base, " / ? * 100"),
            {*requested.total == 0 ? Value::Null()
                                   : Value::Double(*requested.total)});
        break;
    }
    root->measures.push_back(std::move(field));
  }
  return absl::OkStatus();
}

absl::Status PlanTreeBuilder::AttachHavingSortAndLimit(SelectBlock* root) {
  if (query_.having.has_value()) {
    RootScope scope(this, root);
    ExpressionTranslator translator(&dialect_, &scope);
    METRICSQL_ASSIGN_OR_RETURN(SqlFragment having,
                               translator.Translate(*query_.having));
    // Only a block reading the base table aggregates; above child blocks the
    // measures are plain columns and are filtered row by row.
    if (!root->table.empty()) {
      root->having = std::move(having);
    } else {
      METRICSQL_RET_CHECK(root->where.empty());
      root->where = std::move(having);
    }
  }
  for (const Sort& sort : query_.sort) {
    OrderField order;
    order.field = CanonicalName(sort.name);
    order.desc = sort.desc;
    if (root->FindField(order.field) == nullptr) {
      return MakeCompileInvariantError()
             << "Sort field " << sort.name << " is not selected";
    }
    root->order.push_back(std::move(order));
  }
  root->limit = query_.limit;
  root->offset = query_.offset;
  return absl::OkStatus();
}

absl::StatusOr<PlanTree> PlanTreeBuilder::Build() {
  if (!query_.pivot_on.empty()) {
    return MakeUnsupportedFeatureError()
           << "Pivoting on " << absl::StrJoin(query_.pivot_on, ", ")
           << " is not supported by the plan builder";
  }

  std::optional<Expression> filter = query_.where;
  if (security_policy_ != nullptr) {
    filter = CombineWithAnd(std::move(filter), security_policy_->RowFilter());
  }
  if (filter.has_value()) {
    ExpressionTranslator translator(&dialect_, this);
    METRICSQL_ASSIGN_OR_RETURN(base_filter_, translator.Translate(*filter));
  }

  if (query_.rows) {
    METRICSQL_ASSIGN_OR_RETURN(SelectBlock * root, tree_.AddBlock(kRootAlias));
    METRICSQL_RETURN_IF_ERROR(BuildRawRows(root));
    return std::move(tree_);
  }

  METRICSQL_RETURN_IF_ERROR(ResolveMeasures());
  bool has_comparison = false;
  for (const RequestedMeasure& requested : requested_) {
    has_comparison |= requested.role == MeasureRole::kComparisonValue ||
                      requested.role == MeasureRole::kComparisonDelta ||
                      requested.role == MeasureRole::kComparisonRatio;
  }

  SelectBlock* root = nullptr;
  if (has_comparison) {
    if (!query_.comparison_time_range.has_value()) {
      return MakeCompileInvariantError()
             << "Comparison measures require a comparison time range";
    }
    METRICSQL_ASSIGN_OR_RETURN(root, tree_.AddBlock(kRootAlias));
    METRICSQL_RETURN_IF_ERROR(BuildComparisonRoot(root));
  } else {
    METRICSQL_ASSIGN_OR_RETURN(root, BuildPeriod(kRootAlias, query_.time_range));
    METRICSQL_RETURN_IF_ERROR(BuildSinglePeriodRoot(root));
  }
  root->use_display_names = query_.use_display_names;
  METRICSQL_RETURN_IF_ERROR(AttachHavingSortAndLimit(root));

  if (dimensions_only_) {
    root->measures.clear();
  }
  return std::move(tree_);
}

}  // namespace

absl::StatusOr<PlanTree> PlanBuilder::Build(const Query& query) const {
  METRICSQL_RET_CHECK(view_ != nullptr);
  METRICSQL_RET_CHECK(dialect_ != nullptr);
  PlanTreeBuilder builder(*view_, security_policy_, *dialect_, calendar_,
                          query, /*dimensions_only=*/false);
  return builder.Build();
}

}  // namespace metricsql
