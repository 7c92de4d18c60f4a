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

#include "rank_metrics/utils/status_macros.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "rank_metrics/utils/logging.h"
#include "rank_metrics/utils/test.h"

namespace rank_metrics {
namespace utils {
namespace status_macros {
namespace {

using test::StatusIs;

absl::StatusOr<int> CheckPositive(const int a) {
  if (a < 0) {
    return absl::InvalidArgumentError("A is lower than zero.");
  }
  return a;
}

TEST(StatusMacros, RETURN_IF_ERROR) {
  const auto check_two_positive = [&](const int a,
                                      const int b) -> absl::Status {
    RETURN_IF_ERROR(CheckPositive(a).status());
    RETURN_IF_ERROR(CheckPositive(b).status());
    return absl::OkStatus();
  };

  EXPECT_OK(check_two_positive(1, 2));
  EXPECT_THAT(check_two_positive(-1, 2),
              StatusIs(absl::StatusCode::kInvalidArgument, "lower than zero"));
  EXPECT_FALSE(check_two_positive(1, -2).ok());
}

TEST(StatusMacros, ASSIGN_OR_RETURN_2ARGS) {
  const auto g = [&](const int a) -> absl::StatusOr<int> {
    ASSIGN_OR_RETURN(const int b, CheckPositive(a));
    return b + 1;
  };

  ASSERT_OK_AND_ASSIGN(const int value, g(1));
  EXPECT_EQ(value, 2);
  EXPECT_FALSE(g(-1).ok());
}

TEST(StatusMacros, ASSIGN_OR_RETURN_3ARGS) {
  const auto g = [&](const int a) -> absl::Status {
    ASSIGN_OR_RETURN(const int b, CheckPositive(a), _ << "a:" << a);
    LOG(INFO) << "b:" << b;
    return absl::OkStatus();
  };

  EXPECT_OK(g(1));
  EXPECT_FALSE(g(-1).ok());
}

TEST(StatusMacros, STATUS_CHECK) {
  const auto g = [](const int a, const int b) -> absl::Status {
    STATUS_CHECK_LE(a, b);
    STATUS_CHECK_NE(a, 5);
    return absl::OkStatus();
  };

  EXPECT_OK(g(1, 2));
  EXPECT_THAT(g(3, 2),
              StatusIs(absl::StatusCode::kInvalidArgument, "Check failed"));
  EXPECT_THAT(g(5, 6), StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(StatusMacros, STATUS_FATALS) {
  const auto g = [](const int a) -> absl::Status {
    if (a > 1) {
      STATUS_FATALS("Value ", a, " is too large");
    }
    return absl::OkStatus();
  };

  EXPECT_OK(g(1));
  EXPECT_THAT(g(3), StatusIs(absl::StatusCode::kInvalidArgument,
                             "Value 3 is too large"));
}

}  // namespace
}  // namespace status_macros
}  // namespace utils
}  // namespace rank_metrics
