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

// Streaming weighted mean of per-list metric values.
//
// The accumulator keeps two Kahan compensated sums: the sum of
// "value * weight" and the sum of "weight". It does not keep any history.
//
// Usage example:
//   WeightedMeanAccumulator accumulator;
//   accumulator.Add(/*value=*/1.0, /*weight=*/2.0);
//   accumulator.Add(/*value=*/0.0, /*weight=*/1.0);
//   accumulator.Result();  // 0.6666
//
// The accumulator is not thread safe.
//
#ifndef RANK_METRICS_METRIC_WEIGHTED_MEAN_H_
#define RANK_METRICS_METRIC_WEIGHTED_MEAN_H_

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "rank_metrics/metric/metric.pb.h"

namespace rank_metrics {
namespace metric {

class WeightedMeanAccumulator {
 public:
  // Adds a weighted value. Values with a zero weight are ignored.
  void Add(double value, double weight);

  // Adds a batch of weighted values. "values" and "weights" should have the
  // same size.
  absl::Status Accumulate(absl::Span<const double> values,
                          absl::Span<const double> weights);

  // Adds the totals of another accumulator.
  void Merge(const WeightedMeanAccumulator& other);

  // Weighted mean of the accumulated values. Zero if the total weight is not
  // positive.
  double Result() const;

  void Reset();

  double total_weighted_value() const { return weighted_values_.Sum(); }
  double total_weight() const { return weights_.Sum(); }

  // Snapshot and restoration of the accumulated totals.
  proto::AccumulatorState Save() const;
  void Restore(const proto::AccumulatorState& state);

 private:
  // Kahan summation.
  class AccurateSum {
   public:
    AccurateSum() {}
    AccurateSum(const double sum, const double error_sum)
        : sum_(sum), error_sum_(error_sum) {}

    void Add(const double value) {
      error_sum_ += value;
      const auto new_sum = sum_ + error_sum_;
      error_sum_ += sum_ - new_sum;
      sum_ = new_sum;
    }

    double Sum() const { return sum_; }
    double ErrorSum() const { return error_sum_; }

   private:
    double sum_ = 0.;
    double error_sum_ = 0.;
  };

  AccurateSum weighted_values_;
  AccurateSum weights_;
};

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_WEIGHTED_MEAN_H_
