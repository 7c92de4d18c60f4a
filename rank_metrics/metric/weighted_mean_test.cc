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

#include "rank_metrics/metric/weighted_mean.h"

#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "rank_metrics/metric/metric.pb.h"
#include "rank_metrics/utils/test.h"

namespace rank_metrics {
namespace metric {
namespace {

using test::StatusIs;

TEST(WeightedMean, Empty) {
  WeightedMeanAccumulator accumulator;
  EXPECT_EQ(accumulator.Result(), 0.);
  EXPECT_EQ(accumulator.total_weight(), 0.);
}

TEST(WeightedMean, Base) {
  WeightedMeanAccumulator accumulator;
  accumulator.Add(1., 1.);
  accumulator.Add(4., 3.);
  EXPECT_NEAR(accumulator.Result(), 13. / 4., 1e-9);
  EXPECT_NEAR(accumulator.total_weighted_value(), 13., 1e-9);
  EXPECT_NEAR(accumulator.total_weight(), 4., 1e-9);
}

TEST(WeightedMean, ZeroWeightValuesAreIgnored) {
  WeightedMeanAccumulator accumulator;
  accumulator.Add(0.5, 2.);
  accumulator.Add(100., 0.);
  EXPECT_NEAR(accumulator.Result(), 0.5, 1e-9);
  EXPECT_NEAR(accumulator.total_weight(), 2., 1e-9);
}

TEST(WeightedMean, Accumulate) {
  WeightedMeanAccumulator accumulator;
  EXPECT_OK(accumulator.Accumulate({1., 2., 3.}, {1., 0., 1.}));
  EXPECT_NEAR(accumulator.Result(), 2., 1e-9);
  EXPECT_THAT(accumulator.Accumulate({1., 2.}, {1.}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "2 values were provided with 1 weights"));
  // The failed call did not change the state.
  EXPECT_NEAR(accumulator.Result(), 2., 1e-9);
}

TEST(WeightedMean, Reset) {
  WeightedMeanAccumulator accumulator;
  accumulator.Add(1., 1.);
  accumulator.Reset();
  EXPECT_EQ(accumulator.Result(), 0.);
  EXPECT_EQ(accumulator.total_weight(), 0.);
  accumulator.Add(3., 2.);
  EXPECT_NEAR(accumulator.Result(), 3., 1e-9);
}

TEST(WeightedMean, MergeEqualsAccumulatingBothInputs) {
  const std::vector<double> values = {0.1, 0.7, 0.3, 1.0, 0.0, 0.25};
  const std::vector<double> weights = {1., 2., 0.5, 3., 1., 4.};

  WeightedMeanAccumulator all;
  WeightedMeanAccumulator part_1;
  WeightedMeanAccumulator part_2;
  for (int idx = 0; idx < values.size(); idx++) {
    all.Add(values[idx], weights[idx]);
    (idx % 2 == 0 ? part_1 : part_2).Add(values[idx], weights[idx]);
  }
  part_1.Merge(part_2);
  EXPECT_NEAR(part_1.Result(), all.Result(), 1e-12);
  EXPECT_NEAR(part_1.total_weight(), all.total_weight(), 1e-12);
}

TEST(WeightedMean, MergeKeepsTheCompensationTerms) {
  WeightedMeanAccumulator other;
  proto::AccumulatorState state;
  state.set_sum_weighted_values(3.);
  state.set_sum_weighted_values_error(1.5);
  state.set_sum_weights(1.);
  state.set_sum_weights_error(0.5);
  other.Restore(state);

  WeightedMeanAccumulator accumulator;
  accumulator.Merge(other);
  EXPECT_NEAR(accumulator.total_weighted_value(), 4.5, 1e-9);
  EXPECT_NEAR(accumulator.total_weight(), 1.5, 1e-9);
}

TEST(WeightedMean, SaveAndRestore) {
  WeightedMeanAccumulator accumulator;
  accumulator.Add(0.2, 1.);
  accumulator.Add(0.9, 2.);
  const auto state = accumulator.Save();

  WeightedMeanAccumulator restored;
  restored.Restore(state);
  EXPECT_EQ(restored.Result(), accumulator.Result());

  accumulator.Add(0.5, 1.);
  restored.Add(0.5, 1.);
  EXPECT_EQ(restored.Result(), accumulator.Result());
}

TEST(WeightedMean, CompensatedSummation) {
  WeightedMeanAccumulator accumulator;
  accumulator.Add(1., 1e8);
  for (int i = 0; i < 1000000; i++) {
    accumulator.Add(0., 1e-8);
  }
  // Without compensation, each small weight is partially lost.
  EXPECT_NEAR(accumulator.total_weight(), 1e8 + 1e-2, 1e-6);
}

}  // namespace
}  // namespace metric
}  // namespace rank_metrics
