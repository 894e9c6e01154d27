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

#ifndef METRICSQL_BASE_SOURCE_LOCATION_H_
#define METRICSQL_BASE_SOURCE_LOCATION_H_

// A minimal file/line capture used by the status macros so that errors
// produced by METRICSQL_RET_CHECK and friends carry the place they came from.

#include <cstdint>

#include "absl/base/config.h"

#if defined(__is_identifier)
#define METRICSQL_INTERNAL_HAS_KEYWORD(x) !(__is_identifier(x))
#else
#define METRICSQL_INTERNAL_HAS_KEYWORD(x) 0
#endif

#if !defined(METRICSQL_INTERNAL_HAVE_SOURCE_LOCATION_CURRENT)
#if METRICSQL_INTERNAL_HAS_KEYWORD(__builtin_LINE) && \
    METRICSQL_INTERNAL_HAS_KEYWORD(__builtin_FILE)
#define METRICSQL_INTERNAL_HAVE_SOURCE_LOCATION_CURRENT 1
#elif defined(__GNUC__) && __GNUC__ >= 5
#define METRICSQL_INTERNAL_HAVE_SOURCE_LOCATION_CURRENT 1
#else
#define METRICSQL_INTERNAL_HAVE_SOURCE_LOCATION_CURRENT 0
#endif
#endif

#undef METRICSQL_INTERNAL_HAS_KEYWORD

namespace metricsql_base {

class SourceLocation {
  struct PrivateTag {
   private:
    explicit PrivateTag() = default;
    friend class SourceLocation;
  };

 public:
  // Avoid this constructor; it populates the object with dummy values.
  constexpr SourceLocation() : line_(0), file_name_(nullptr) {}

  // Only to be used by the METRICSQL_LOC macro.
  static constexpr SourceLocation DoNotInvokeDirectly(std::uint_least32_t line,
                                                      const char* file_name) {
    return SourceLocation(line, file_name);
  }

#if METRICSQL_INTERNAL_HAVE_SOURCE_LOCATION_CURRENT
  // Creates a SourceLocation for the caller when used as a default argument.
  static constexpr SourceLocation current(
      PrivateTag = PrivateTag{}, std::uint_least32_t line = __builtin_LINE(),
      const char* file_name = __builtin_FILE()) {
    return SourceLocation(line, file_name);
  }
#else
  static constexpr SourceLocation current() {
    return SourceLocation(1, "<source_location>");
  }
#endif

  constexpr std::uint_least32_t line() const { return line_; }
  constexpr const char* file_name() const { return file_name_; }

 private:
  constexpr SourceLocation(std::uint_least32_t line, const char* file_name)
      : line_(line), file_name_(file_name) {}

  std::uint_least32_t line_;
  const char* file_name_;
};

}  // namespace metricsql_base

// Captures the current file and line as a metricsql_base::SourceLocation.
#define METRICSQL_LOC \
  ::metricsql_base::SourceLocation::DoNotInvokeDirectly(__LINE__, __FILE__)

#endif  // METRICSQL_BASE_SOURCE_LOCATION_H_
