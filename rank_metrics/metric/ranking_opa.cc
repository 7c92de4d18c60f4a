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

#include "rank_metrics/metric/ranking_opa.h"

#include <cmath>
#include <limits>

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {
namespace {

float ComparableScore(const float score) {
  return std::isnan(score) ? -std::numeric_limits<float>::infinity() : score;
}

}  // namespace

ListMetric OPACalculator::Compute(const RankedList& list) const {
  const auto& src = list.list();
  double sum_correct_weights = 0.;
  double sum_weights = 0.;
  for (int rank_1 = 0; rank_1 < list.num_valid(); rank_1++) {
    const int item_1 = list.item(rank_1);
    for (int rank_2 = 0; rank_2 < list.num_valid(); rank_2++) {
      const int item_2 = list.item(rank_2);
      if (src.labels[item_1] <= src.labels[item_2]) {
        continue;
      }
      const double pair_weight = src.weight(item_1);
      sum_weights += pair_weight;
      if (ComparableScore(src.scores[item_1]) >=
          ComparableScore(src.scores[item_2])) {
        sum_correct_weights += pair_weight;
      }
    }
  }
  if (sum_weights == 0.) {
    return {};
  }
  return {sum_correct_weights / sum_weights, sum_weights};
}

}  // namespace metric
}  // namespace rank_metrics
