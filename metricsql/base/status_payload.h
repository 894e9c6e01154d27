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

#ifndef METRICSQL_BASE_STATUS_PAYLOAD_H_
#define METRICSQL_BASE_STATUS_PAYLOAD_H_

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace metricsql_base {

extern const absl::string_view kMetricSqlTypeUrlPrefix;

// Return the type_url for encoding a Status payload of proto type T.
template <class T>
std::string GetTypeUrl() {
  return absl::StrCat(kMetricSqlTypeUrlPrefix, T::descriptor()->full_name());
}

// Attaches the given payload. This will overwrite any previous payload with
// the same type.
template <class T>
void AttachPayload(absl::Status* status, const T& payload) {
  absl::Cord serialized = absl::Cord(payload.SerializeAsString());
  status->SetPayload(GetTypeUrl<T>(), serialized);
}

// Whether `status` carries a payload of type T.
template <class T>
bool HasPayloadWithType(const absl::Status& status) {
  return status.GetPayload(GetTypeUrl<T>()).has_value();
}

// Gets the payload of type T. Returns a default instance if the status has no
// such payload or it does not parse.
template <class T>
T GetPayload(const absl::Status& status) {
  std::optional<absl::Cord> payload = status.GetPayload(GetTypeUrl<T>());
  T proto;
  if (!payload.has_value()) {
    return proto;
  }
  if (!proto.ParseFromString(std::string(*payload))) {
    proto.Clear();
  }
  return proto;
}

}  // namespace metricsql_base

#endif  // METRICSQL_BASE_STATUS_PAYLOAD_H_
