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

#ifndef METRICSQL_PUBLIC_SECURITY_POLICY_H_
#define METRICSQL_PUBLIC_SECURITY_POLICY_H_

#include <optional>
#include <string>
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/string_view.h"
#include "metricsql/public/expression.h"

namespace metricsql {

// The resolved access policy of the caller for one metrics view. Resolving
// the policy is done elsewhere; the compiler only asks whether a field is
// visible and which row filter to AND into every base filter.
class SecurityPolicy {
 public:
  virtual ~SecurityPolicy() = default;

  // Whether the dimension or measure `name` may be referenced at all.
  virtual bool CanAccessField(absl::string_view name) const = 0;

  // A row-level filter over dimensions of the view, or nullopt for none.
  virtual std::optional<Expression> RowFilter() const = 0;
};

// A policy with an optional row filter and an optional allow-list of fields.
// With no allow-list every field is accessible.
class SimpleSecurityPolicy : public SecurityPolicy {
 public:
  SimpleSecurityPolicy() = default;

  void set_row_filter(Expression filter) { row_filter_ = std::move(filter); }

  // Restricts access to the fields passed to AllowField().
  void AllowField(absl::string_view name);

  bool CanAccessField(absl::string_view name) const override;
  std::optional<Expression> RowFilter() const override { return row_filter_; }

 private:
  std::optional<Expression> row_filter_;
  std::optional<absl::flat_hash_set<std::string>> allowed_fields_;
};

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_SECURITY_POLICY_H_
