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

#include <string>

#include "absl/status/status.h"
#include "metricsql/base/logging.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/base/status_macros.h"
#include "metricsql/common/errors.h"
#include "metricsql/proto/options.pb.h"
#include "metricsql/public/value.h"

namespace metricsql {

namespace {

class PercentOfTotalRewriter : public Rewriter {
 public:
  Stage stage() const override { return QUERY; }

  absl::Status RewriteQuery(const RewriteContext& context, Query* query,
                            RewriteOutputProperties& properties) const override {
    for (Measure& measure : query->measures) {
      if (!measure.compute.has_value() ||
          measure.compute->kind != MeasureCompute::PERCENT_OF_TOTAL ||
          measure.compute->total.has_value()) {
        continue;
      }
      METRICSQL_ASSIGN_OR_RETURN(measure.compute->total,
                                 FetchTotal(context, *query, *measure.compute));
      METRICSQL_VLOG(2) << "Grand total of " << measure.compute->target
                        << " is " << *measure.compute->total;
    }
    return absl::OkStatus();
  }

  std::string Name() const override { return "PercentOfTotalRewriter"; }

 private:
  static absl::StatusOr<double> FetchTotal(const RewriteContext& context,
                                           const Query& query,
                                           const MeasureCompute& measure) {
    METRICSQL_RET_CHECK(context.execution_context != nullptr);
    if (context.executor == nullptr) {
      return MakeRewriteError(REWRITE_PERCENT_OF_TOTAL,
                              absl::StatusCode::kFailedPrecondition)
             << "Percent of total of " << measure.target
             << " requires a query executor";
    }
    METRICSQL_RETURN_IF_ERROR(context.execution_context->CheckAlive());
    METRICSQL_ASSIGN_OR_RETURN(
        Value total,
        context.executor->ExecuteScalar(MakeGrandTotalQuery(query, measure),
                                        *context.execution_context));
    switch (total.kind()) {
      case Value::NULL_VALUE:
        // No matching rows.
        return 0.0;
      case Value::INT64:
        return static_cast<double>(total.int64_value());
      case Value::DOUBLE:
        return total.double_value();
      default:
        return MakeRewriteError(REWRITE_PERCENT_OF_TOTAL)
               << "The grand total of " << measure.target
               << " is not numeric: " << total.DebugString();
    }
  }
};

}  // namespace

Query MakeGrandTotalQuery(const Query& query, const MeasureCompute& measure) {
  Query total;
  total.metrics_view = query.metrics_view;
  total.measures.push_back(Measure{measure.target});
  total.where = query.where;
  total.time_range = query.time_range;
  total.time_zone = query.time_zone;
  return total;
}

const Rewriter* GetPercentOfTotalRewriter() {
  static const Rewriter* rewriter = new PercentOfTotalRewriter();
  return rewriter;
}

}  // namespace metricsql
