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

#include "rank_metrics/metric/ranking_mrr.h"

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

MRRCalculator::MRRCalculator(const int truncation) : truncation_(truncation) {}

ListMetric MRRCalculator::Compute(const RankedList& list) const {
  const double weight = MeanRelevantItemWeight(list);
  if (weight == 0.) {
    return {};
  }
  const int max_rank = list.TruncatedSize(truncation_);
  for (int rank = 0; rank < max_rank; rank++) {
    if (IsRelevant(list.label_at(rank))) {
      return {1.0 / (rank + 1.0), weight};
    }
  }
  return {0.0, weight};
}

}  // namespace metric
}  // namespace rank_metrics
