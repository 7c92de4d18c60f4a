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

// Compute the Discounted Cumulative Gain (DCG) and the Normalized Discounted
// Cumulative Gain (NDCG) ranking metrics.
//
// The gain of an item is "gain(label)" and the discount of the rank "r"
// (1-indexed) is "discount(r)". Both default to "2^label-1" and
// "1/log2(1+r)". The gains are multiplied by the item weights.
//
// The ideal DCG used to normalize NDCG sorts the items by decreasing label,
// each item keeping its weight. NDCG is clamped to [0, 1] since a heavy item
// with a low label can make the DCG exceed the ideal DCG.
//
#ifndef RANK_METRICS_METRIC_RANKING_NDCG_H_
#define RANK_METRICS_METRIC_RANKING_NDCG_H_

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

class DCGCalculator {
 public:
  DCGCalculator(int truncation, GainFn gain = DefaultGain,
                DiscountFn discount = DefaultRankDiscount);

  // Computes the DCG@truncation of a ranked list. The list weight is the
  // gain-weighted mean of the item weights.
  ListMetric Compute(const RankedList& list) const;

  // DCG@truncation of the list in its ranked order.
  double DCG(const RankedList& list) const;

  // DCG@truncation of the valid items sorted by decreasing label. Each item
  // keeps its weight.
  double IdealDCG(const RankedList& list) const;

  // Gain-weighted mean of the item weights. Zero if all the gains are zero.
  double ListWeight(const RankedList& list) const;

 private:
  int truncation_;
  GainFn gain_;
  DiscountFn discount_;
};

class NDCGCalculator {
 public:
  NDCGCalculator(int truncation, GainFn gain = DefaultGain,
                 DiscountFn discount = DefaultRankDiscount);

  // Computes the NDCG@truncation of a ranked list. The value is zero if the
  // ideal DCG is zero.
  ListMetric Compute(const RankedList& list) const;

 private:
  DCGCalculator dcg_;
};

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_RANKING_NDCG_H_
