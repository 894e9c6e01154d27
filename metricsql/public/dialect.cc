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

#include "metricsql/public/dialect.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "metricsql/base/ret_check.h"
#include "metricsql/base/status_builder.h"
#include "metricsql/base/status_macros.h"

namespace metricsql {

std::string QuoteIdentifier(absl::string_view identifier, char quote) {
  std::string out;
  out.reserve(identifier.size() + 2);
  out.push_back(quote);
  for (char c : identifier) {
    if (c == quote) out.push_back(quote);
    out.push_back(c);
  }
  out.push_back(quote);
  return out;
}

std::string QuoteStringLiteral(absl::string_view value) {
  return QuoteIdentifier(value, '\'');
}

int WeekStartShiftDays(const DateTruncSpec& spec) {
  if (spec.grain != TimeGrain::kWeek) return 0;
  return (spec.first_day_of_week + 6) % 7;
}

int YearStartShiftMonths(const DateTruncSpec& spec) {
  const int shift = (spec.first_month_of_year + 11) % 12;
  if (spec.grain == TimeGrain::kYear) return shift;
  if (spec.grain == TimeGrain::kQuarter) return shift % 3;
  return 0;
}

std::string Dialect::EscapeIdentifier(absl::string_view identifier) const {
  return QuoteIdentifier(identifier, '"');
}

std::string Dialect::JoinOnExpr(absl::string_view lhs,
                                absl::string_view rhs) const {
  return absl::StrCat(lhs, " IS NOT DISTINCT FROM ", rhs);
}

std::string Dialect::JoinKeyword(JoinKind kind) const {
  switch (kind) {
    case JoinKind::kFullOuter:
      return "FULL OUTER JOIN";
    case JoinKind::kLeft:
      return "LEFT OUTER JOIN";
    case JoinKind::kRight:
      return "RIGHT OUTER JOIN";
  }
  return "JOIN";
}

std::string Dialect::FirstValueAggregate(absl::string_view expr) const {
  return absl::StrCat("ANY_VALUE(", expr, ")");
}

std::string Dialect::LimitClause(std::optional<int64_t> limit,
                                 std::optional<int64_t> offset) const {
  std::string out;
  if (limit.has_value()) {
    absl::StrAppend(&out, "LIMIT ", *limit);
  }
  if (offset.has_value() && *offset > 0) {
    absl::StrAppend(&out, out.empty() ? "" : " ", "OFFSET ", *offset);
  }
  return out;
}

std::string Dialect::EscapeQualifiedName(
    absl::Span<const std::string> parts) const {
  return absl::StrJoin(parts, ".", [this](std::string* out,
                                          const std::string& part) {
    absl::StrAppend(out, EscapeIdentifier(part));
  });
}

std::string Dialect::QualifiedColumn(absl::string_view alias,
                                     absl::string_view name) const {
  if (alias.empty()) return EscapeIdentifier(name);
  return absl::StrCat(EscapeIdentifier(alias), ".", EscapeIdentifier(name));
}

DialectRegistry& DialectRegistry::global_instance() {
  static DialectRegistry* registry = new DialectRegistry();
  return *registry;
}

absl::Status DialectRegistry::Register(std::unique_ptr<const Dialect> dialect) {
  METRICSQL_RET_CHECK(dialect != nullptr);
  const std::string key = absl::AsciiStrToLower(dialect->Name());
  if (by_name_.contains(key)) {
    return ::metricsql_base::FailedPreconditionErrorBuilder()
           << "Dialect " << key << " is already registered";
  }
  by_name_.emplace(key, dialect.get());
  dialects_.push_back(std::move(dialect));
  return absl::OkStatus();
}

absl::StatusOr<const Dialect*> DialectRegistry::Get(
    absl::string_view name) const {
  auto it = by_name_.find(absl::AsciiStrToLower(name));
  if (it == by_name_.end()) {
    return ::metricsql_base::NotFoundErrorBuilder()
           << "Unknown dialect: " << name;
  }
  return it->second;
}

std::vector<std::string> DialectRegistry::RegisteredNames() const {
  std::vector<std::string> names;
  names.reserve(dialects_.size());
  for (const auto& dialect : dialects_) {
    names.push_back(dialect->Name());
  }
  return names;
}

}  // namespace metricsql
