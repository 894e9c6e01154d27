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

#include "metricsql/rewriters/rewrite_pipeline.h"

#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "metricsql/base/logging.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/base/status_macros.h"
#include "metricsql/common/errors.h"
#include "metricsql/proto/options.pb.h"
#include "metricsql/rewriters/all_rewriters.h"
#include "metricsql/rewriters/registration.h"

namespace metricsql {

namespace {

absl::Status RunRewriters(
    const RewriteContext& context, Rewriter::Stage stage,
    absl::FunctionRef<absl::Status(const Rewriter&)> run) {
  METRICSQL_RET_CHECK(context.options != nullptr);
  RegisterBuiltinRewriters();
  const RewriteRegistry& rewrite_registry = RewriteRegistry::global_instance();
  for (RewritePass pass : rewrite_registry.registration_order()) {
    if (!context.options->rewrite_enabled(pass)) {
      continue;
    }
    const Rewriter* rewriter = rewrite_registry.Get(pass);
    METRICSQL_RET_CHECK(rewriter != nullptr)
        << "Requested rewriter was not present in the registry: "
        << RewritePass_Name(pass);
    if (rewriter->stage() != stage) {
      continue;
    }
    METRICSQL_VLOG(2) << "Running rewriter " << rewriter->Name();
    METRICSQL_RETURN_IF_ERROR(AnnotateRewriteError(run(*rewriter), pass));
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status RunQueryRewriters(const RewriteContext& context, Query* query,
                               RewriteOutputProperties& properties) {
  return RunRewriters(context, Rewriter::QUERY, [&](const Rewriter& rewriter) {
    return rewriter.RewriteQuery(context, query, properties);
  });
}

absl::Status RunPlanRewriters(const RewriteContext& context, PlanTree* tree,
                              RewriteOutputProperties& properties) {
  return RunRewriters(context, Rewriter::PLAN, [&](const Rewriter& rewriter) {
    return rewriter.RewritePlan(context, tree, properties);
  });
}

}  // namespace metricsql
