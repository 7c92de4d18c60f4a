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

// Compute the Average Relevance Position (ARP) ranking metric.
//
// ARP is the weighted mean of the 1-indexed ranks of the relevant items (label
// >0). Lower is better. ARP always considers the entire list.
//
#ifndef RANK_METRICS_METRIC_RANKING_ARP_H_
#define RANK_METRICS_METRIC_RANKING_ARP_H_

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

class ARPCalculator {
 public:
  // Computes the ARP of a list. The list weight is the sum of the weights of
  // the relevant items.
  ListMetric Compute(const RankedList& list) const;
};

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_RANKING_ARP_H_
