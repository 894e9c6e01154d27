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

#include "metricsql/dialects/builtin_dialects.h"

#include <memory>

#include "absl/base/call_once.h"
#include "absl/log/absl_check.h"
#include "metricsql/dialects/clickhouse_dialect.h"
#include "metricsql/dialects/druid_dialect.h"
#include "metricsql/dialects/duckdb_dialect.h"
#include "metricsql/public/dialect.h"

namespace metricsql {

void RegisterBuiltinDialects() {
  static absl::once_flag once_flag;
  absl::call_once(once_flag, [] {
    DialectRegistry& r = DialectRegistry::global_instance();
    // Registration only fails on duplicate names.
    ABSL_CHECK_OK(r.Register(std::make_unique<DuckDbDialect>()));
    ABSL_CHECK_OK(r.Register(std::make_unique<ClickHouseDialect>()));
    ABSL_CHECK_OK(r.Register(std::make_unique<DruidDialect>()));
  });
}

}  // namespace metricsql
