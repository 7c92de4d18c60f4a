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

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "rank_metrics/utils/test.h"

namespace file {
namespace {

using rank_metrics::test::StatusIs;

std::string TmpPath(const std::string& filename) {
  return absl::StrCat(::testing::TempDir(), "/", filename);
}

TEST(Filesystem, Override) {
  const auto file_path = TmpPath("file.txt");
  EXPECT_OK(SetContent(file_path, "a"));
  EXPECT_EQ(GetContent(file_path).value(), "a");

  EXPECT_OK(SetContent(file_path, "b"));
  EXPECT_EQ(GetContent(file_path).value(), "b");
}

TEST(Filesystem, LargeContent) {
  const auto file_path = TmpPath("large_file.txt");
  std::string content(1024 * 10 + 512 + 64, 0);
  for (int i = 0; i < content.size(); i++) {
    content[i] = i % 255;
  }
  EXPECT_OK(SetContent(file_path, content));
  EXPECT_EQ(GetContent(file_path).value(), content);
}

TEST(Filesystem, MissingFile) {
  EXPECT_THAT(GetContent(TmpPath("does_not_exist.txt")).status(),
              StatusIs(absl::StatusCode::kUnknown, "Failed to open"));
}

}  // namespace
}  // namespace file
