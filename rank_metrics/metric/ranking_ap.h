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

// Compute the Mean Average Precision (MAP) ranking metric.
//
// The relevance is binary: items with a label >0 are relevant.
//
#ifndef RANK_METRICS_METRIC_RANKING_AP_H_
#define RANK_METRICS_METRIC_RANKING_AP_H_

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

class APCalculator {
 public:
  explicit APCalculator(int truncation);

  // Computes the average precision of a list i.e. the weighted mean, over
  // the relevant items in the top "truncation" ranks, of the precision at the
  // rank of this item.
  ListMetric Compute(const RankedList& list) const;

 private:
  int truncation_;
};

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_RANKING_AP_H_
