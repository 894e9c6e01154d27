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

#include "metricsql/base/ret_check.h"

#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "metricsql/base/source_location.h"
#include "metricsql/base/status_builder.h"
#include "metricsql/proto/compile_error.pb.h"

namespace metricsql_base {
namespace internal_ret_check {

namespace {

// Every failed check is a broken compiler invariant.
StatusBuilder InvariantErrorBuilder(SourceLocation location,
                                    absl::string_view condition) {
  metricsql::CompileErrorInfo info;
  info.set_kind(metricsql::COMPILE_INVARIANT);
  StatusBuilder builder = InternalErrorBuilder(location).Attach(info);
  builder.LogError() << "METRICSQL_RET_CHECK failure ("
                     << location.file_name() << ":" << location.line()
                     << ") ";
  if (!condition.empty()) builder << condition << " ";
  return builder;
}

}  // namespace

StatusBuilder RetCheckFailSlowPath(SourceLocation location) {
  return InvariantErrorBuilder(location, "");
}

StatusBuilder RetCheckFailSlowPath(SourceLocation location,
                                   std::string* condition) {
  std::unique_ptr<std::string> owned(condition);
  return InvariantErrorBuilder(location, *owned);
}

StatusBuilder RetCheckFailSlowPath(SourceLocation location,
                                   const char* condition) {
  return InvariantErrorBuilder(location, condition);
}

StatusBuilder RetCheckFailSlowPath(SourceLocation location,
                                   const char* condition,
                                   const absl::Status& status) {
  // The failed status's own payload is not carried over.
  return InvariantErrorBuilder(location, condition)
         << "returned " << status << " ";
}

}  // namespace internal_ret_check
}  // namespace metricsql_base
