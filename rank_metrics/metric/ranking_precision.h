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

// Compute the Precision and Recall ranking metrics at a cutoff.
//
// The relevance is binary: items with a label >0 are relevant. Items are
// weighted by their item weight.
//
#ifndef RANK_METRICS_METRIC_RANKING_PRECISION_H_
#define RANK_METRICS_METRIC_RANKING_PRECISION_H_

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

class PrecisionCalculator {
 public:
  explicit PrecisionCalculator(int truncation);

  // Weighted fraction of relevant items among the top "truncation" items.
  ListMetric Compute(const RankedList& list) const;

 private:
  int truncation_;
};

class RecallCalculator {
 public:
  explicit RecallCalculator(int truncation);

  // Weighted fraction of the relevant items of the list found in the top
  // "truncation" items.
  ListMetric Compute(const RankedList& list) const;

 private:
  int truncation_;
};

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_RANKING_PRECISION_H_
