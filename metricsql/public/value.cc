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

#include "metricsql/public/value.h"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/time/time.h"

namespace metricsql {

Value Value::StringList(absl::Span<const std::string> elements) {
  std::vector<Value> values;
  values.reserve(elements.size());
  for (const std::string& element : elements) {
    values.push_back(Value::String(element));
  }
  return Value::List(std::move(values));
}

std::string Value::DebugString() const {
  switch (kind()) {
    case NULL_VALUE:
      return "NULL";
    case BOOL:
      return bool_value() ? "true" : "false";
    case INT64:
      return absl::StrCat(int64_value());
    case DOUBLE:
      return absl::StrCat(double_value());
    case STRING:
      return absl::StrCat("'", absl::StrReplaceAll(string_value(), {{"'", "''"}}),
                          "'");
    case TIMESTAMP:
      return absl::StrCat(
          "TIMESTAMP '",
          absl::FormatTime(absl::RFC3339_full, timestamp_value(),
                           absl::UTCTimeZone()),
          "'");
    case LIST:
      return absl::StrCat(
          "[",
          absl::StrJoin(elements(), ", ",
                        [](std::string* out, const Value& v) {
                          absl::StrAppend(out, v.DebugString());
                        }),
          "]");
  }
  return "<invalid value>";
}

std::ostream& operator<<(std::ostream& out, const Value& value) {
  return out << value.DebugString();
}

}  // namespace metricsql
