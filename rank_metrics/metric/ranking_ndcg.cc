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

#include "rank_metrics/metric/ranking_ndcg.h"

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

DCGCalculator::DCGCalculator(const int truncation, GainFn gain,
                             DiscountFn discount)
    : truncation_(truncation),
      gain_(std::move(gain)),
      discount_(std::move(discount)) {}

ListMetric DCGCalculator::Compute(const RankedList& list) const {
  const double weight = ListWeight(list);
  if (weight == 0.) {
    return {};
  }
  return {DCG(list), weight};
}

double DCGCalculator::DCG(const RankedList& list) const {
  const int max_rank = list.TruncatedSize(truncation_);
  double dcg = 0.;
  for (int rank = 0; rank < max_rank; rank++) {
    dcg += list.weight_at(rank) * gain_(list.label_at(rank)) *
           discount_(rank + 1);
  }
  return dcg;
}

double DCGCalculator::IdealDCG(const RankedList& list) const {
  // Valid items by decreasing label. Ties are ordered by decreasing weight.
  std::vector<std::pair<float, float>> label_and_weights;
  label_and_weights.reserve(list.num_valid());
  for (int rank = 0; rank < list.num_valid(); rank++) {
    label_and_weights.emplace_back(list.label_at(rank), list.weight_at(rank));
  }
  std::sort(label_and_weights.begin(), label_and_weights.end(),
            std::greater<std::pair<float, float>>());

  const int max_rank = list.TruncatedSize(truncation_);
  double idcg = 0.;
  for (int rank = 0; rank < max_rank; rank++) {
    idcg += label_and_weights[rank].second *
            gain_(label_and_weights[rank].first) * discount_(rank + 1);
  }
  return idcg;
}

double DCGCalculator::ListWeight(const RankedList& list) const {
  double sum_weighted_gains = 0.;
  double sum_gains = 0.;
  for (int rank = 0; rank < list.num_valid(); rank++) {
    const double gain = gain_(list.label_at(rank));
    sum_weighted_gains += list.weight_at(rank) * gain;
    sum_gains += gain;
  }
  if (sum_gains <= 0.) {
    return 0.;
  }
  return sum_weighted_gains / sum_gains;
}

NDCGCalculator::NDCGCalculator(const int truncation, GainFn gain,
                               DiscountFn discount)
    : dcg_(truncation, std::move(gain), std::move(discount)) {}

ListMetric NDCGCalculator::Compute(const RankedList& list) const {
  const double weight = dcg_.ListWeight(list);
  if (weight == 0.) {
    return {};
  }
  // "idcg" is independent of the predictions.
  const double idcg = dcg_.IdealDCG(list);
  if (idcg == 0.) {
    return {0., weight};
  }
  // With non-uniform item weights, the DCG can exceed the label-ordered DCG.
  return {std::min(1.0, dcg_.DCG(list) / idcg), weight};
}

}  // namespace metric
}  // namespace rank_metrics
