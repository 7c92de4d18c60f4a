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

#include "rank_metrics/metric/ranking_precision.h"

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

PrecisionCalculator::PrecisionCalculator(const int truncation)
    : truncation_(truncation) {}

ListMetric PrecisionCalculator::Compute(const RankedList& list) const {
  const double weight = MeanRelevantItemWeight(list);
  if (weight == 0.) {
    return {};
  }
  const int max_rank = list.TruncatedSize(truncation_);
  double sum_relevant_weights = 0.;
  double sum_weights = 0.;
  for (int rank = 0; rank < max_rank; rank++) {
    const double item_weight = list.weight_at(rank);
    if (IsRelevant(list.label_at(rank))) {
      sum_relevant_weights += item_weight;
    }
    sum_weights += item_weight;
  }
  if (sum_weights == 0.) {
    return {0., weight};
  }
  return {sum_relevant_weights / sum_weights, weight};
}

RecallCalculator::RecallCalculator(const int truncation)
    : truncation_(truncation) {}

ListMetric RecallCalculator::Compute(const RankedList& list) const {
  const double weight = MeanRelevantItemWeight(list);
  if (weight == 0.) {
    return {};
  }
  const int max_rank = list.TruncatedSize(truncation_);
  double sum_retrieved_weights = 0.;
  double sum_relevant_weights = 0.;
  for (int rank = 0; rank < list.num_valid(); rank++) {
    if (!IsRelevant(list.label_at(rank))) {
      continue;
    }
    const double item_weight = list.weight_at(rank);
    sum_relevant_weights += item_weight;
    if (rank < max_rank) {
      sum_retrieved_weights += item_weight;
    }
  }
  // "sum_relevant_weights" is positive since "weight" is positive.
  return {sum_retrieved_weights / sum_relevant_weights, weight};
}

}  // namespace metric
}  // namespace rank_metrics
