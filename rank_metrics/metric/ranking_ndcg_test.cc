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

#include "rank_metrics/metric/ranking_ndcg.h"

#include <cmath>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "rank_metrics/dataset/ranking_list.h"
#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {
namespace {

dataset::RankingList MakeList(std::vector<float> labels,
                              std::vector<float> scores,
                              std::vector<float> weights = {}) {
  dataset::RankingList list;
  list.labels = std::move(labels);
  list.scores = std::move(scores);
  list.weights = std::move(weights);
  return list;
}

ListMetric ComputeDCG(const dataset::RankingList& list) {
  return DCGCalculator(kNoTruncation).Compute(RankedList(list, nullptr));
}

ListMetric ComputeNDCG(const dataset::RankingList& list) {
  return NDCGCalculator(kNoTruncation).Compute(RankedList(list, nullptr));
}

TEST(DCG, Base) {
  const auto list = MakeList({3, 2, 0}, {0.9f, 0.5f, 0.1f});
  const auto result = ComputeDCG(list);
  EXPECT_NEAR(result.value, 8.892789260714373, 1e-6);
  EXPECT_NEAR(result.weight, 1., 1e-9);
}

TEST(DCG, ReversedScores) {
  const auto list = MakeList({3, 2, 0}, {0.1f, 0.5f, 0.9f});
  const auto result = ComputeDCG(list);
  EXPECT_NEAR(result.value, 5.392789260714372, 1e-6);
}

TEST(DCG, Truncation) {
  const auto list = MakeList({3, 2, 0}, {0.9f, 0.5f, 0.1f});
  const RankedList ranked_list(list, nullptr);
  EXPECT_NEAR(DCGCalculator(1).Compute(ranked_list).value, 7., 1e-6);
}

TEST(DCG, CustomFunctions) {
  const auto list = MakeList({3, 2, 0}, {0.9f, 0.5f, 0.1f});
  const DCGCalculator dcg(
      kNoTruncation, [](const double label) { return label; },
      [](const double rank) { return 1. / rank; });
  EXPECT_NEAR(dcg.Compute(RankedList(list, nullptr)).value, 4., 1e-9);
}

TEST(DCG, WeightIsTheGainWeightedItemWeight) {
  const auto list = MakeList({1, 0, 2}, {3, 2, 1}, {4, 9, 1});
  const auto result = ComputeDCG(list);
  // (4 * 1 + 1 * 3) / (1 + 3).
  EXPECT_NEAR(result.weight, 7. / 4., 1e-9);
}

TEST(DCG, NoGain) {
  const auto list = MakeList({0, 0}, {2, 1});
  const auto result = ComputeDCG(list);
  EXPECT_EQ(result.value, 0.);
  EXPECT_EQ(result.weight, 0.);
}

TEST(NDCG, PerfectRanking) {
  const auto list = MakeList({3, 2, 0}, {0.9f, 0.5f, 0.1f});
  const auto result = ComputeNDCG(list);
  EXPECT_NEAR(result.value, 1., 1e-9);
  EXPECT_NEAR(result.weight, 1., 1e-9);
}

TEST(NDCG, ReversedScores) {
  const auto list = MakeList({3, 2, 0}, {0.1f, 0.5f, 0.9f});
  const auto result = ComputeNDCG(list);
  EXPECT_NEAR(result.value, 0.606422698504514, 1e-6);
}

TEST(NDCG, Truncation) {
  const auto list = MakeList({3, 2, 0}, {0.1f, 0.5f, 0.9f});
  const RankedList ranked_list(list, nullptr);
  EXPECT_NEAR(NDCGCalculator(1).Compute(ranked_list).value, 0., 1e-9);
  // DCG@2 = 3 / log2(3), IDCG@2 = 7 + 3 / log2(3).
  const double dcg = 3. / std::log2(3.);
  EXPECT_NEAR(NDCGCalculator(2).Compute(ranked_list).value, dcg / (7. + dcg),
              1e-6);
}

TEST(NDCG, IsBounded) {
  const auto list =
      MakeList({1, 0, 2, 3, 0}, {5, 1, 2, 4, 3}, {2, 1, 0.5, 3, 1});
  for (int truncation : {1, 2, 3, 5, kNoTruncation}) {
    const auto result =
        NDCGCalculator(truncation).Compute(RankedList(list, nullptr));
    EXPECT_GE(result.value, 0.);
    EXPECT_LE(result.value, 1. + 1e-9);
  }
}

TEST(NDCG, WeightedIdealOrder) {
  // Ranked by decreasing label. Each item keeps its weight in the ideal order.
  const auto list = MakeList({2, 1}, {0.9f, 0.1f}, {1, 10});
  const auto result = ComputeNDCG(list);
  EXPECT_NEAR(result.value, 1., 1e-9);

  const DCGCalculator dcg(kNoTruncation);
  const RankedList ranked_list(list, nullptr);
  EXPECT_NEAR(dcg.IdealDCG(ranked_list), 3. + 10. / std::log2(3.), 1e-6);
}

TEST(NDCG, HeavyLowLabelItemIsClamped) {
  // DCG = 10 + 3 / log2(3) is larger than IDCG = 3 + 10 / log2(3).
  const auto list = MakeList({1, 2}, {0.9f, 0.1f}, {10, 1});
  EXPECT_NEAR(ComputeNDCG(list).value, 1., 1e-9);
}

TEST(NDCG, NoGain) {
  const auto list = MakeList({0, 0, 0}, {3, 2, 1});
  const auto result = ComputeNDCG(list);
  EXPECT_EQ(result.value, 0.);
  EXPECT_EQ(result.weight, 0.);
}

}  // namespace
}  // namespace metric
}  // namespace rank_metrics
