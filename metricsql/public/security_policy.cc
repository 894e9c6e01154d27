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

#include "metricsql/public/security_policy.h"

#include <string>

#include "absl/strings/ascii.h"

namespace metricsql {

void SimpleSecurityPolicy::AllowField(absl::string_view name) {
  if (!allowed_fields_.has_value()) {
    allowed_fields_.emplace();
  }
  allowed_fields_->insert(absl::AsciiStrToLower(name));
}

bool SimpleSecurityPolicy::CanAccessField(absl::string_view name) const {
  return !allowed_fields_.has_value() ||
         allowed_fields_->contains(absl::AsciiStrToLower(name));
}

}  // namespace metricsql
