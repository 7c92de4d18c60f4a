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

// Compute the Ordered Pair Accuracy (OPA) ranking metric.
//
// OPA is the fraction of pairs of valid items with different labels for which
// the item with the higher label has a higher or equal score. Each pair is
// weighted by the weight of the item with the higher label. OPA considers all
// the items of the list, independently of any cutoff.
//
#ifndef RANK_METRICS_METRIC_RANKING_OPA_H_
#define RANK_METRICS_METRIC_RANKING_OPA_H_

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

class OPACalculator {
 public:
  // Computes the OPA of a list. The list weight is the sum of the pair
  // weights. Quadratic in the number of valid items.
  ListMetric Compute(const RankedList& list) const;
};

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_RANKING_OPA_H_
