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

#ifndef METRICSQL_PUBLIC_DIALECT_H_
#define METRICSQL_PUBLIC_DIALECT_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "metricsql/public/time_grain.h"

namespace metricsql {

// How a join child is attached to its parent select.
enum class JoinKind {
  kFullOuter,
  kLeft,
  kRight,
};

// Arguments of Dialect::DateTruncExpr().
struct DateTruncSpec {
  // The SQL expression to truncate; already escaped.
  std::string expr;
  TimeGrain grain = TimeGrain::kUnspecified;
  // IANA name. "UTC" when no time zone applies.
  std::string time_zone = "UTC";
  // 1 = Monday ... 7 = Sunday. Only consulted for kWeek.
  int first_day_of_week = 1;
  // 1 = January ... 12 = December. Only consulted for kQuarter and kYear.
  int first_month_of_year = 1;
};

// The SQL syntax and capability profile of one analytical database backend.
//
// The translator, plan builder, rewriters and emitter never branch on the
// dialect name; every backend difference is expressed through this interface.
//
// Thread safety: implementations must be immutable after construction, they
// are shared by all concurrent compilations.
class Dialect {
 public:
  virtual ~Dialect() = default;

  // Registry key, e.g. "duckdb". Lower case.
  virtual std::string Name() const = 0;

  // Quotes `identifier` so that it is never interpreted as a keyword or
  // expression. Defaults to ANSI double quotes with embedded quotes doubled.
  virtual std::string EscapeIdentifier(absl::string_view identifier) const;

  // Whether `ILIKE` / `NOT ILIKE` are available. When false, case-insensitive
  // matching is emitted as `lower(a) LIKE lower(b)`.
  virtual bool SupportsILike() const = 0;

  // Returns an expression truncating `spec.expr` to `spec.grain` in
  // `spec.time_zone`. Returns an UNSUPPORTED_FEATURE error for combinations
  // the backend has no syntax for.
  virtual absl::StatusOr<std::string> DateTruncExpr(
      const DateTruncSpec& spec) const = 0;

  // Returns a predicate matching `lhs` and `rhs` in a join on dimension
  // values, including when both are NULL. Defaults to
  // `lhs IS NOT DISTINCT FROM rhs`.
  virtual std::string JoinOnExpr(absl::string_view lhs,
                                 absl::string_view rhs) const;

  // The keyword sequence introducing a join of `kind`.
  virtual std::string JoinKeyword(JoinKind kind) const;

  // Whether the backend benefits from (and correctly executes) one-sided
  // joins between comparison periods when approximate comparisons are
  // allowed.
  virtual bool SupportsApproximateComparisons() const = 0;

  // Whether selects with join children must be explicitly grouped, with every
  // measure wrapped in FirstValueAggregate(), to be well defined.
  virtual bool RequiresGroupingForJoins() const = 0;

  // A deterministic aggregate returning the (single) value of `expr` in a
  // group. Defaults to `ANY_VALUE(expr)`.
  virtual std::string FirstValueAggregate(absl::string_view expr) const;

  // The LIMIT/OFFSET suffix; empty when neither is set.
  virtual std::string LimitClause(std::optional<int64_t> limit,
                                  std::optional<int64_t> offset) const;

  // The row cap applied when the compiler options do not set one. 0 means
  // unlimited.
  virtual int64_t DefaultRowCap() const { return 0; }

  // Non-virtual helpers shared by all dialects.

  // Escapes each part of a qualified name and joins them with '.'.
  std::string EscapeQualifiedName(absl::Span<const std::string> parts) const;

  // Returns `name` escaped and prefixed with `alias.` when `alias` is set.
  std::string QualifiedColumn(absl::string_view alias,
                              absl::string_view name) const;
};

// Days to shift a timestamp back before truncating to a Monday-based week so
// that weeks start on `spec.first_day_of_week`. 0 unless grain is kWeek.
int WeekStartShiftDays(const DateTruncSpec& spec);

// Months to shift a timestamp back before truncating to a January-based
// quarter or year so that years start on `spec.first_month_of_year`. 0 unless
// grain is kQuarter or kYear.
int YearStartShiftMonths(const DateTruncSpec& spec);

// Returns `value` as a single-quoted SQL string literal.
std::string QuoteStringLiteral(absl::string_view value);

// Returns `identifier` wrapped in `quote`, doubling embedded quotes.
std::string QuoteIdentifier(absl::string_view identifier, char quote);

// Process-wide registry of dialects keyed by Name(). Populated once at
// startup (see RegisterBuiltinDialects()) and read-only afterwards.
class DialectRegistry {
 public:
  DialectRegistry() = default;
  DialectRegistry(const DialectRegistry&) = delete;
  DialectRegistry& operator=(const DialectRegistry&) = delete;

  static DialectRegistry& global_instance();

  // Returns an error if a dialect with the same name is registered.
  absl::Status Register(std::unique_ptr<const Dialect> dialect);

  // Case-insensitive. Returns a NOT_FOUND error for unknown names.
  absl::StatusOr<const Dialect*> Get(absl::string_view name) const;

  // In registration order.
  std::vector<std::string> RegisteredNames() const;

 private:
  std::vector<std::unique_ptr<const Dialect>> dialects_;
  absl::flat_hash_map<std::string, const Dialect*> by_name_;
};

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_DIALECT_H_
