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

// Compute the Alpha Discounted Cumulative Gain (alpha-DCG) ranking metric.
//
// alpha-DCG is a diversity-aware DCG. Each item covers a set of subtopics.
// The gain of an item is the sum, over its subtopics "t", of
// "gain(1) * (1-alpha)^c_t" where "c_t" is the number of higher ranked items
// covering "t". "alpha" in [0, 1] controls the penalty of redundant items.
//
// See "Novelty and Diversity in Information Retrieval Evaluation", Clarke et
// al., SIGIR 2008.
//
#ifndef RANK_METRICS_METRIC_RANKING_ALPHA_DCG_H_
#define RANK_METRICS_METRIC_RANKING_ALPHA_DCG_H_

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

class AlphaDCGCalculator {
 public:
  AlphaDCGCalculator(int truncation, double alpha, GainFn gain = DefaultGain,
                     DiscountFn discount = DefaultRankDiscount);

  // Computes the alpha-DCG@truncation of a list annotated with subtopics. The
  // list weight is the mean item weight, where each item counts once per
  // subtopic it covers.
  ListMetric Compute(const RankedList& list) const;

 private:
  int truncation_;
  double alpha_;
  GainFn gain_;
  DiscountFn discount_;
};

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_RANKING_ALPHA_DCG_H_
