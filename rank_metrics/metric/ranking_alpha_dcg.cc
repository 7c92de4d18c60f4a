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

#include "rank_metrics/metric/ranking_alpha_dcg.h"

#include <cmath>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"
#include "rank_metrics/utils/logging.h"

namespace rank_metrics {
namespace metric {

AlphaDCGCalculator::AlphaDCGCalculator(const int truncation,
                                       const double alpha, GainFn gain,
                                       DiscountFn discount)
    : truncation_(truncation),
      alpha_(alpha),
      gain_(std::move(gain)),
      discount_(std::move(discount)) {}

ListMetric AlphaDCGCalculator::Compute(const RankedList& list) const {
  DCHECK(list.list().has_subtopics());
  const double weight = MeanSubtopicCoverageWeight(list);
  if (weight == 0.) {
    return {};
  }

  // Gain of a subtopic covered for the first time.
  const double subtopic_gain = gain_(1.0);

  // Number of items, ranked so far, covering each subtopic.
  absl::flat_hash_map<int, int> coverage;

  const int max_rank = list.TruncatedSize(truncation_);
  double alpha_dcg = 0.;
  for (int rank = 0; rank < max_rank; rank++) {
    double item_gain = 0.;
    for (const int subtopic : UniqueSubtopics(list.subtopics_at(rank))) {
      int& count = coverage[subtopic];
      item_gain += subtopic_gain * std::pow(1.0 - alpha_, count);
      count++;
    }
    alpha_dcg += list.weight_at(rank) * item_gain * discount_(rank + 1);
  }
  return {alpha_dcg, weight};
}

}  // namespace metric
}  // namespace rank_metrics
