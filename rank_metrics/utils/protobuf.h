/*
 * Copyright 2022 Google LLC.
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Utilities for the manipulation of Protobufs.

#ifndef RANK_METRICS_UTILS_PROTOBUF_H_
#define RANK_METRICS_UTILS_PROTOBUF_H_

#include <string>
#include <typeinfo>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"

namespace rank_metrics {
namespace utils {

// Deserializes a proto from its text representation.
template <typename T>
absl::StatusOr<T> ParseTextProto(absl::string_view raw) {
  T message;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(raw),
                                                     &message)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot parse protobuf ", typeid(T).name(), " from text"));
  }
  return message;
}

// Serializes a proto to its text representation. The output can be parsed
// back with "ParseTextProto".
absl::StatusOr<std::string> SerializeTextProto(
    const google::protobuf::Message& message, bool single_line_mode = false);

}  // namespace utils
}  // namespace rank_metrics

#endif  // RANK_METRICS_UTILS_PROTOBUF_H_
