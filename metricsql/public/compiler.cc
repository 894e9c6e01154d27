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

#include <utility>

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "metricsql/base/logging.h"
#include "metricsql/base/status_macros.h"
#include "metricsql/common/errors.h"
#include "metricsql/common/time_util.h"
#include "metricsql/dialects/builtin_dialects.h"
#include "metricsql/planner/plan_builder.h"
#include "metricsql/planner/plan_tree.h"
#include "metricsql/planner/sql_emitter.h"
#include "metricsql/public/rewriter_interface.h"
#include "metricsql/public/validator.h"
#include "metricsql/rewriters/rewrite_pipeline.h"

namespace metricsql {

namespace {

absl::StatusOr<CompiledQuery> CompileImpl(const Query& input,
                                          const MetricsView& view,
                                          const SecurityPolicy* security_policy,
                                          const Dialect& dialect,
                                          const CompilerOptions& options,
                                          const ExecutionContext& context,
                                          QueryExecutor* executor) {
  METRICSQL_RETURN_IF_ERROR(options.Validate());
  METRICSQL_VLOG(1) << "Compiling query on metrics view " << view.name()
                    << " for dialect " << dialect.Name();
  METRICSQL_RETURN_IF_ERROR(ValidateQuery(input, view, security_policy));

  RewriteContext rewrite_context;
  rewrite_context.view = &view;
  rewrite_context.dialect = &dialect;
  rewrite_context.options = &options;
  rewrite_context.execution_context = &context;
  rewrite_context.executor = executor;
  rewrite_context.now = options.execution_time().value_or(absl::Now());

  CalendarSettings calendar;
  calendar.time_zone =
      input.time_zone.empty() ? options.time_zone() : input.time_zone;
  calendar.first_day_of_week = view.first_day_of_week() != 0
                                   ? view.first_day_of_week()
                                   : options.first_day_of_week();
  calendar.first_month_of_year = view.first_month_of_year() != 0
                                     ? view.first_month_of_year()
                                     : options.first_month_of_year();
  METRICSQL_RETURN_IF_ERROR(
      FindTimeZoneByName(calendar.time_zone, &rewrite_context.time_zone));
  rewrite_context.first_day_of_week = calendar.first_day_of_week;
  rewrite_context.first_month_of_year = calendar.first_month_of_year;

  RewriteOutputProperties properties;
  Query query = input;
  METRICSQL_RETURN_IF_ERROR(
      RunQueryRewriters(rewrite_context, &query, properties));

  PlanBuilder builder(&view, security_policy, &dialect, std::move(calendar));
  METRICSQL_ASSIGN_OR_RETURN(PlanTree tree, builder.Build(query));
  METRICSQL_RETURN_IF_ERROR(
      RunPlanRewriters(rewrite_context, &tree, properties));
  METRICSQL_VLOG(4) << "Plan:\n" << tree.DebugString();

  METRICSQL_ASSIGN_OR_RETURN(SqlFragment statement,
                             SqlEmitter(&dialect).Emit(tree));
  CompiledQuery compiled;
  compiled.sql = std::move(statement.sql);
  compiled.args = std::move(statement.args);
  compiled.row_cap = properties.row_cap;
  return compiled;
}

}  // namespace

absl::StatusOr<CompiledQuery> Compile(const Query& query,
                                      const MetricsView& view,
                                      const SecurityPolicy* security_policy,
                                      const Dialect& dialect,
                                      const CompilerOptions& options,
                                      const ExecutionContext& context,
                                      QueryExecutor* executor) {
  absl::StatusOr<CompiledQuery> compiled = CompileImpl(
      query, view, security_policy, dialect, options, context, executor);
  if (!compiled.ok()) {
    METRICSQL_VLOG(1) << "Compilation failed with a "
                      << CompileErrorKindName(
                             GetCompileErrorKind(compiled.status()))
                      << " error: " << compiled.status();
  }
  return compiled;
}

absl::StatusOr<CompiledQuery> Compile(const Query& query,
                                      const MetricsView& view,
                                      const SecurityPolicy* security_policy,
                                      absl::string_view dialect_name,
                                      const CompilerOptions& options,
                                      const ExecutionContext& context,
                                      QueryExecutor* executor) {
  RegisterBuiltinDialects();
  METRICSQL_ASSIGN_OR_RETURN(
      const Dialect* dialect,
      DialectRegistry::global_instance().Get(dialect_name));
  return Compile(query, view, security_policy, *dialect, options, context,
                 executor);
}

}  // namespace metricsql
