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

// Utilities for ranking metrics.

#ifndef RANK_METRICS_METRIC_RANKING_UTILS_H_
#define RANK_METRICS_METRIC_RANKING_UTILS_H_

#include <cmath>
#include <functional>
#include <limits>

namespace rank_metrics {
namespace metric {

// Truncation of a metric without cutoff.
constexpr int kNoTruncation = std::numeric_limits<int>::max();

// Value of a metric on a single list, and weight of this list in the
// aggregated metric. A weight of zero means that the list is ignored.
struct ListMetric {
  double value = 0.;
  double weight = 0.;
};

// Maps a relevance label to a gain.
using GainFn = std::function<double(double label)>;

// Maps a 1-indexed rank to a discount factor.
using DiscountFn = std::function<double(double rank)>;

// Computes "2^label-1".
inline double DefaultGain(const double label) {
  return std::exp2(label) - 1.0;
}

// Computes "ln(2)/ln(1+rank)" i.e. "1/log2(1+rank)".
inline double DefaultRankDiscount(const double rank) {
  return std::log(2.0) / std::log1p(rank);
}

// Binary relevance of a valid item.
inline bool IsRelevant(const float label) { return label > 0.f; }

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_RANKING_UTILS_H_
