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

#include "rank_metrics/utils/filesystem.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <ios>
#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace file {

absl::StatusOr<std::string> GetContent(absl::string_view path) {
  std::ifstream file_stream(std::string(path), std::ios::binary);
  if (!file_stream.is_open()) {
    return absl::Status(absl::StatusCode::kUnknown,
                        absl::StrCat("Failed to open ", path,
                                     " with error:", std::strerror(errno)));
  }
  std::stringstream content;
  content << file_stream.rdbuf();
  if (file_stream.bad()) {
    return absl::Status(absl::StatusCode::kUnknown,
                        absl::StrCat("Failed to read ", path));
  }
  return content.str();
}

absl::Status SetContent(absl::string_view path, absl::string_view content) {
  std::ofstream file_stream(std::string(path), std::ios::binary);
  if (!file_stream.is_open()) {
    return absl::Status(absl::StatusCode::kUnknown,
                        absl::StrCat("Failed to open ", path,
                                     " with error:", std::strerror(errno)));
  }
  file_stream.write(content.data(), content.size());
  file_stream.close();
  if (file_stream.bad()) {
    return absl::Status(absl::StatusCode::kUnknown,
                        absl::StrCat("Failed to write ", path));
  }
  return absl::OkStatus();
}

}  // namespace file
