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

#ifndef METRICSQL_PUBLIC_COMPILER_OPTIONS_H_
#define METRICSQL_PUBLIC_COMPILER_OPTIONS_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/container/btree_set.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "metricsql/proto/options.pb.h"

namespace metricsql {

// Process or request level settings of the compiler. Copyable value class.
class CompilerOptions {
 public:
  CompilerOptions();
  CompilerOptions(const CompilerOptions&) = default;
  CompilerOptions& operator=(const CompilerOptions&) = default;

  // Serialize/deserialize to/from CompilerOptionsProto. A proto with no
  // enabled_rewrites deserializes to DefaultRewrites().
  absl::Status Serialize(CompilerOptionsProto* proto) const;
  static absl::Status Deserialize(const CompilerOptionsProto& proto,
                                  CompilerOptions* result);

  // Returns an error for an unknown time zone or an out-of-range
  // week or year start.
  absl::Status Validate() const;

  // The maximum number of rows a compiled query may return. Unset means the
  // dialect's DefaultRowCap(); 0 means unlimited.
  const std::optional<int64_t>& row_cap() const { return row_cap_; }
  void set_row_cap(int64_t row_cap) { row_cap_ = row_cap; }
  void clear_row_cap() { row_cap_.reset(); }

  // Period comparisons may use one-sided joins, which omit rows present only
  // in the period that is not sorted on.
  bool allow_approximate_comparisons() const {
    return allow_approximate_comparisons_;
  }
  void set_allow_approximate_comparisons(bool allow) {
    allow_approximate_comparisons_ = allow;
  }

  // By default every pass in DefaultRewrites() is enabled.
  void set_enabled_rewrites(absl::btree_set<RewritePass> rewrites) {
    enabled_rewrites_ = std::move(rewrites);
  }
  const absl::btree_set<RewritePass>& enabled_rewrites() const {
    return enabled_rewrites_;
  }
  void enable_rewrite(RewritePass rewrite, bool enable = true);
  ABSL_MUST_USE_RESULT bool rewrite_enabled(RewritePass rewrite) const {
    return enabled_rewrites_.contains(rewrite);
  }
  static absl::btree_set<RewritePass> DefaultRewrites();

  // The anchor of relative time ranges. Unset means absl::Now() at the start
  // of each compilation.
  const std::optional<absl::Time>& execution_time() const {
    return execution_time_;
  }
  void set_execution_time(absl::Time time) { execution_time_ = time; }

  // IANA time zone used for relative time ranges and time grains when the
  // query does not name one.
  const std::string& time_zone() const { return time_zone_; }
  void set_time_zone(absl::string_view time_zone) {
    time_zone_ = std::string(time_zone);
  }

  // 1 = Monday ... 7 = Sunday. Overridden by the metrics view when set there.
  int first_day_of_week() const { return first_day_of_week_; }
  void set_first_day_of_week(int day) { first_day_of_week_ = day; }

  // 1 = January ... 12 = December. Overridden by the metrics view when set
  // there.
  int first_month_of_year() const { return first_month_of_year_; }
  void set_first_month_of_year(int month) { first_month_of_year_ = month; }

 private:
  std::optional<int64_t> row_cap_;
  bool allow_approximate_comparisons_ = false;
  absl::btree_set<RewritePass> enabled_rewrites_;
  std::optional<absl::Time> execution_time_;
  std::string time_zone_ = "UTC";
  int first_day_of_week_ = 1;
  int first_month_of_year_ = 1;
};

}  // namespace metricsql

#endif  // METRICSQL_PUBLIC_COMPILER_OPTIONS_H_
