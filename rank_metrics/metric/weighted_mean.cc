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

#include <cstddef>

#include "absl/status/status.h"
#include "absl/strings/substitute.h"
#include "absl/types/span.h"
#include "rank_metrics/metric/metric.pb.h"

namespace rank_metrics {
namespace metric {

void WeightedMeanAccumulator::Add(const double value, const double weight) {
  if (weight == 0.) {
    return;
  }
  weighted_values_.Add(value * weight);
  weights_.Add(weight);
}

absl::Status WeightedMeanAccumulator::Accumulate(
    absl::Span<const double> values, absl::Span<const double> weights) {
  if (values.size() != weights.size()) {
    return absl::InvalidArgumentError(
        absl::Substitute("$0 values were provided with $1 weights.",
                         values.size(), weights.size()));
  }
  for (size_t idx = 0; idx < values.size(); idx++) {
    Add(values[idx], weights[idx]);
  }
  return absl::OkStatus();
}

void WeightedMeanAccumulator::Merge(const WeightedMeanAccumulator& other) {
  weighted_values_.Add(other.weighted_values_.Sum());
  weighted_values_.Add(other.weighted_values_.ErrorSum());
  weights_.Add(other.weights_.Sum());
  weights_.Add(other.weights_.ErrorSum());
}

double WeightedMeanAccumulator::Result() const {
  if (weights_.Sum() <= 0.) {
    return 0.;
  }
  return weighted_values_.Sum() / weights_.Sum();
}

void WeightedMeanAccumulator::Reset() {
  weighted_values_ = AccurateSum();
  weights_ = AccurateSum();
}

proto::AccumulatorState WeightedMeanAccumulator::Save() const {
  proto::AccumulatorState state;
  state.set_sum_weighted_values(weighted_values_.Sum());
  state.set_sum_weighted_values_error(weighted_values_.ErrorSum());
  state.set_sum_weights(weights_.Sum());
  state.set_sum_weights_error(weights_.ErrorSum());
  return state;
}

void WeightedMeanAccumulator::Restore(const proto::AccumulatorState& state) {
  weighted_values_ = AccurateSum(state.sum_weighted_values(),
                                 state.sum_weighted_values_error());
  weights_ = AccurateSum(state.sum_weights(), state.sum_weights_error());
}

}  // namespace metric
}  // namespace rank_metrics
