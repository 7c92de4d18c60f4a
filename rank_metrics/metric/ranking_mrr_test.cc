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

#include "rank_metrics/metric/ranking_mrr.h"

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

ListMetric Compute(const dataset::RankingList& list,
                   const int truncation = kNoTruncation) {
  return MRRCalculator(truncation).Compute(RankedList(list, nullptr));
}

TEST(MRR, Base) {
  const auto list = MakeList({0, 1, 0}, {0.9f, 0.1f, 0.5f});
  const auto result = Compute(list);
  EXPECT_NEAR(result.value, 1. / 3., 1e-9);
  EXPECT_NEAR(result.weight, 1., 1e-9);
}

TEST(MRR, FirstRelevantItem) {
  const auto list = MakeList({0, 2, 1, 0}, {4, 3, 2, 1});
  const auto result = Compute(list);
  EXPECT_NEAR(result.value, 0.5, 1e-9);
}

TEST(MRR, Truncation) {
  const auto list = MakeList({0, 1, 0}, {0.9f, 0.1f, 0.5f});
  EXPECT_NEAR(Compute(list, 2).value, 0., 1e-9);
  EXPECT_NEAR(Compute(list, 3).value, 1. / 3., 1e-9);
  // The weight does not depend on the truncation.
  EXPECT_NEAR(Compute(list, 2).weight, 1., 1e-9);
}

TEST(MRR, NoRelevantItem) {
  const auto list = MakeList({0, 0, 0}, {3, 2, 1});
  const auto result = Compute(list);
  EXPECT_EQ(result.value, 0.);
  EXPECT_EQ(result.weight, 0.);
}

TEST(MRR, WeightIsTheMeanRelevantItemWeight) {
  const auto list = MakeList({1, 0, 1}, {3, 2, 1}, {2, 7, 4});
  const auto result = Compute(list);
  EXPECT_NEAR(result.value, 1., 1e-9);
  EXPECT_NEAR(result.weight, 3., 1e-9);
}

TEST(MRR, PaddingIsIgnored) {
  const auto list = MakeList({-1, 0, 1}, {10, 2, 1});
  const auto result = Compute(list);
  EXPECT_NEAR(result.value, 0.5, 1e-9);
}

}  // namespace
}  // namespace metric
}  // namespace rank_metrics
