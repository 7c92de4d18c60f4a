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

#include "rank_metrics/metric/ranking_ap.h"

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

APCalculator::APCalculator(const int truncation) : truncation_(truncation) {}

ListMetric APCalculator::Compute(const RankedList& list) const {
  const double weight = MeanRelevantItemWeight(list);
  if (weight == 0.) {
    return {};
  }
  const int max_rank = list.TruncatedSize(truncation_);
  double sum_weighted_precision = 0.0;
  double sum_weights = 0.0;
  double num_relevant = 0;
  for (int rank = 0; rank < max_rank; rank++) {
    if (IsRelevant(list.label_at(rank))) {
      num_relevant++;
      const double item_weight = list.weight_at(rank);
      sum_weighted_precision += item_weight * num_relevant / (rank + 1);
      sum_weights += item_weight;
    }
  }
  if (sum_weights > 0) {
    return {sum_weighted_precision / sum_weights, weight};
  } else {
    return {0.0, weight};
  }
}

}  // namespace metric
}  // namespace rank_metrics
