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

#include "rank_metrics/metric/ranking_precision_ia.h"

#include "absl/container/flat_hash_set.h"
#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"
#include "rank_metrics/utils/logging.h"

namespace rank_metrics {
namespace metric {

PrecisionIACalculator::PrecisionIACalculator(const int truncation)
    : truncation_(truncation) {}

ListMetric PrecisionIACalculator::Compute(const RankedList& list) const {
  DCHECK(list.list().has_subtopics());
  const double weight = MeanSubtopicCoverageWeight(list);
  if (weight == 0.) {
    return {};
  }

  absl::flat_hash_set<int> subtopics;
  for (int rank = 0; rank < list.num_valid(); rank++) {
    const auto& item_subtopics = list.subtopics_at(rank);
    subtopics.insert(item_subtopics.begin(), item_subtopics.end());
  }

  // The sum of the per-subtopic precisions is the weighted number of
  // (item, subtopic) coverage pairs in the top items.
  const int max_rank = list.TruncatedSize(truncation_);
  double sum_weighted_coverage = 0.;
  double sum_weights = 0.;
  for (int rank = 0; rank < max_rank; rank++) {
    const double item_weight = list.weight_at(rank);
    sum_weighted_coverage +=
        item_weight * UniqueSubtopics(list.subtopics_at(rank)).size();
    sum_weights += item_weight;
  }
  if (sum_weights == 0.) {
    return {0., weight};
  }
  return {sum_weighted_coverage / (sum_weights * subtopics.size()), weight};
}

}  // namespace metric
}  // namespace rank_metrics
