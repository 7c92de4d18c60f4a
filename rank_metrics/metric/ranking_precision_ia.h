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

// Compute the Intent-Aware Precision (Precision-IA) ranking metric.
//
// For each subtopic covered by the list, the precision at the cutoff is the
// weighted fraction of the top items covering this subtopic. Precision-IA is
// the uniform average of those precisions over the subtopics covered by at
// least one valid item of the list.
//
// See "Diversifying Search Results", Agrawal et al., WSDM 2009.
//
#ifndef RANK_METRICS_METRIC_RANKING_PRECISION_IA_H_
#define RANK_METRICS_METRIC_RANKING_PRECISION_IA_H_

#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

class PrecisionIACalculator {
 public:
  explicit PrecisionIACalculator(int truncation);

  ListMetric Compute(const RankedList& list) const;

 private:
  int truncation_;
};

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_RANKING_PRECISION_IA_H_
