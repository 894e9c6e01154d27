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

#ifndef METRICSQL_PUBLIC_VALUE_H_
#define METRICSQL_PUBLIC_VALUE_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "absl/types/span.h"

namespace metricsql {

// A literal value. Used for Value expressions and for the positional
// arguments bound to the placeholders of generated SQL.
//
// A Value is either NULL, a scalar, or a list of values. Lists only appear as
// the right-hand side of IN / NOT IN and are expanded into one placeholder
// per element; they are never bound as a single argument.
class Value {
 public:
  enum Kind {
    NULL_VALUE,
    BOOL,
    INT64,
    DOUBLE,
    STRING,
    TIMESTAMP,
    LIST,
  };

  // Constructs a NULL value.
  Value() = default;
  Value(const Value&) = default;
  Value(Value&&) = default;
  Value& operator=(const Value&) = default;
  Value& operator=(Value&&) = default;

  static Value Null() { return Value(); }
  static Value Bool(bool v) { return Value(v); }
  static Value Int64(int64_t v) { return Value(v); }
  static Value Double(double v) { return Value(v); }
  static Value String(absl::string_view v) { return Value(std::string(v)); }
  static Value Timestamp(absl::Time v) { return Value(v); }
  static Value List(std::vector<Value> elements) {
    return Value(std::move(elements));
  }
  static Value StringList(absl::Span<const std::string> elements);

  Kind kind() const { return static_cast<Kind>(rep_.index()); }
  bool is_null() const { return kind() == NULL_VALUE; }
  bool is_list() const { return kind() == LIST; }

  // REQUIRES: the corresponding kind().
  bool bool_value() const { return std::get<bool>(rep_); }
  int64_t int64_value() const { return std::get<int64_t>(rep_); }
  double double_value() const { return std::get<double>(rep_); }
  const std::string& string_value() const { return std::get<std::string>(rep_); }
  absl::Time timestamp_value() const { return std::get<absl::Time>(rep_); }
  const std::vector<Value>& elements() const {
    return std::get<std::vector<Value>>(rep_);
  }

  // Returns a SQL-like rendering, e.g. NULL, 42, 'London',
  // TIMESTAMP '2024-01-01T00:00:00+00:00' or ['a', 'b'].
  std::string DebugString() const;

  bool operator==(const Value& other) const { return rep_ == other.rep_; }
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  template <typename T>
  explicit Value(T v) : rep_(std::move(v)) {}

  // The alternative order matches Kind.
  std::variant<std::monostate, bool, int64_t, double, std::string, absl::Time,
               std::vector<Value>>
      rep_;
};

// Allows Values to be logged and printed by gtest.
std::ostream& operator<<(std::ostream& out, const Value& value);

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_VALUE_H_
