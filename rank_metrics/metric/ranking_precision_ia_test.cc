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

#include "rank_metrics/metric/ranking_precision_ia.h"

#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "rank_metrics/dataset/ranking_list.h"
#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {
namespace {

dataset::RankingList MakeSubtopicList() {
  // Items ranked A, B, C, D.
  dataset::RankingList list;
  list.labels = {1, 1, 1, 1};
  list.scores = {4, 3, 2, 1};
  list.subtopics = {{0, 1}, {0}, {1}, {}};
  return list;
}

TEST(PrecisionIA, Base) {
  const auto list = MakeSubtopicList();
  const RankedList ranked_list(list, nullptr);
  EXPECT_NEAR(PrecisionIACalculator(1).Compute(ranked_list).value, 1., 1e-9);
  EXPECT_NEAR(PrecisionIACalculator(2).Compute(ranked_list).value, 0.75, 1e-9);
  EXPECT_NEAR(PrecisionIACalculator(kNoTruncation).Compute(ranked_list).value,
              0.5, 1e-9);
  EXPECT_NEAR(PrecisionIACalculator(kNoTruncation).Compute(ranked_list).weight,
              1., 1e-9);
}

TEST(PrecisionIA, SubtopicsOfPaddedItemsAreIgnored) {
  auto list = MakeSubtopicList();
  list.labels.push_back(-1);
  list.scores.push_back(10);
  list.subtopics.push_back({5, 6, 7});
  EXPECT_NEAR(
      PrecisionIACalculator(2).Compute(RankedList(list, nullptr)).value, 0.75,
      1e-9);
}

TEST(PrecisionIA, NoSubtopic) {
  auto list = MakeSubtopicList();
  list.subtopics = {{}, {}, {}, {}};
  const auto result =
      PrecisionIACalculator(kNoTruncation).Compute(RankedList(list, nullptr));
  EXPECT_EQ(result.value, 0.);
  EXPECT_EQ(result.weight, 0.);
}

}  // namespace
}  // namespace metric
}  // namespace rank_metrics
