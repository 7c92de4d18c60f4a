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

// Utilities for unit testing.

#ifndef RANK_METRICS_UTILS_TEST_H_
#define RANK_METRICS_UTILS_TEST_H_

#include <string>

#include "gmock/gmock.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/message_differencer.h"
#include "rank_metrics/utils/logging.h"

namespace rank_metrics {
namespace test {

// Tests that a absl::Status is of specific type, and contains a specific text.
//
// Usage example:
//    EXPECT_THAT(..., StatusIs(absl::StatusCode::kInvalidArgument, "ABC"));
MATCHER_P2(StatusIs, type, message_contains,
           "Status is " + testing::PrintToString(type) +
               " and contains message \"" +
               testing::PrintToString(message_contains) + "\"") {
  return arg.code() == type &&
         absl::StrContains(arg.message(), message_contains);
}

MATCHER_P(StatusIs, type, "Status is " + testing::PrintToString(type)) {
  return arg.code() == type;
}

MATCHER_P(EqualsProto, expected,
          "Proto is equal to:\n" + expected.DebugString()) {
  return google::protobuf::util::MessageDifferencer::Equivalent(arg, expected);
}

MATCHER(StatusIsOk, "Status is OK") { return arg.ok(); }

#ifndef EXPECT_OK
#define EXPECT_OK(expr) EXPECT_THAT(expr, ::rank_metrics::test::StatusIsOk())
#endif
#ifndef ASSERT_OK
#define ASSERT_OK(expr) ASSERT_THAT(expr, ::rank_metrics::test::StatusIsOk())
#endif

// Asserts that a absl::StatusOr is OK and moves its value into "lhs".
//
// Usage example:
//   ASSERT_OK_AND_ASSIGN(const auto metric, RankingMetric::Create(config));
#define ASSERT_OK_AND_ASSIGN(lhs, rexpr)                                   \
  ASSERT_OK_AND_ASSIGN_IMPL(TEST_MACROS_CONCAT_NAME(_status_or_value,      \
                                                    __COUNTER__),          \
                            lhs, rexpr)

#define ASSERT_OK_AND_ASSIGN_IMPL(statusor, lhs, rexpr)     \
  auto statusor = (rexpr);                                  \
  ASSERT_TRUE(statusor.status().ok()) << statusor.status(); \
  lhs = std::move(statusor).value()

#define TEST_MACROS_CONCAT_NAME(x, y) TEST_MACROS_CONCAT_IMPL(x, y)
#define TEST_MACROS_CONCAT_IMPL(x, y) x##y

// Parse a proto from its text representation. Infers the proto message from
// the destination variable.
//
// Usage example:
// proto::MyMessage a = PARSE_TEST_PROTO("field_1: 5");
class ParseProtoHelper {
 public:
  ParseProtoHelper(absl::string_view text_proto) : text_proto_(text_proto) {}

  template <typename T>
  T call() {
    T message;
    if (!google::protobuf::TextFormat::ParseFromString(text_proto_,
                                                       &message)) {
      LOG(FATAL) << "Cannot parse proto:\n" << text_proto_;
    }
    return message;
  }

  template <typename T>
  operator T() {  // NOLINT(runtime/explicit)
    return call<T>();
  }

 private:
  std::string text_proto_;
};

#define PARSE_TEST_PROTO(str) ::rank_metrics::test::ParseProtoHelper(str)

}  // namespace test
}  // namespace rank_metrics

#endif  // RANK_METRICS_UTILS_TEST_H_
