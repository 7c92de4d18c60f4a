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

#include "rank_metrics/metric/ranked_list.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include "absl/types/span.h"
#include "rank_metrics/dataset/ranking_list.h"
#include "rank_metrics/metric/ranking_utils.h"
#include "rank_metrics/utils/logging.h"
#include "rank_metrics/utils/random.h"

namespace rank_metrics {
namespace metric {
namespace {

struct Candidate {
  float score;
  uint32_t tie_breaker;
  int index;
};

}  // namespace

std::vector<bool> ValidityMask(const dataset::RankingList& list) {
  std::vector<bool> valid(list.size());
  for (int item = 0; item < list.size(); item++) {
    // Note: NaN labels fail the comparison.
    valid[item] = list.labels[item] >= 0.f &&
                  (list.valid.empty() || list.valid[item]);
  }
  return valid;
}

std::vector<int> RankOrder(absl::Span<const float> scores,
                           const std::vector<bool>& valid,
                           utils::RandomEngine* rnd) {
  DCHECK_EQ(scores.size(), valid.size());
  std::vector<Candidate> candidates;
  candidates.reserve(scores.size());
  for (int item = 0; item < scores.size(); item++) {
    if (!valid[item]) {
      continue;
    }
    float score = scores[item];
    if (std::isnan(score)) {
      score = -std::numeric_limits<float>::infinity();
    }
    const uint32_t tie_breaker =
        rnd ? static_cast<uint32_t>((*rnd)()) : uint32_t{0};
    candidates.push_back({score, tie_breaker, item});
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const Candidate& a, const Candidate& b) {
              if (a.score != b.score) {
                return a.score > b.score;
              }
              if (a.tie_breaker != b.tie_breaker) {
                return a.tie_breaker < b.tie_breaker;
              }
              return a.index < b.index;
            });

  std::vector<int> order;
  order.reserve(scores.size());
  for (const auto& candidate : candidates) {
    order.push_back(candidate.index);
  }
  for (int item = 0; item < scores.size(); item++) {
    if (!valid[item]) {
      order.push_back(item);
    }
  }
  return order;
}

RankedList::RankedList(const dataset::RankingList& list,
                       utils::RandomEngine* rnd)
    : list_(&list), valid_(ValidityMask(list)) {
  num_valid_ = std::count(valid_.begin(), valid_.end(), true);
  order_ = RankOrder(list.scores, valid_, rnd);
}

double MeanRelevantItemWeight(const RankedList& list) {
  double sum_weights = 0.;
  int num_relevant = 0;
  for (int rank = 0; rank < list.num_valid(); rank++) {
    if (IsRelevant(list.label_at(rank))) {
      sum_weights += list.weight_at(rank);
      num_relevant++;
    }
  }
  if (num_relevant == 0) {
    return 0.;
  }
  return sum_weights / num_relevant;
}

std::vector<int> UniqueSubtopics(const std::vector<int>& subtopics) {
  std::vector<int> unique = subtopics;
  std::sort(unique.begin(), unique.end());
  unique.erase(std::unique(unique.begin(), unique.end()), unique.end());
  return unique;
}

double MeanSubtopicCoverageWeight(const RankedList& list) {
  DCHECK(list.list().has_subtopics());
  double sum_weighted_coverage = 0.;
  double sum_coverage = 0.;
  for (int rank = 0; rank < list.num_valid(); rank++) {
    const auto coverage = UniqueSubtopics(list.subtopics_at(rank)).size();
    sum_weighted_coverage += coverage * list.weight_at(rank);
    sum_coverage += coverage;
  }
  if (sum_coverage == 0) {
    return 0.;
  }
  return sum_weighted_coverage / sum_coverage;
}

}  // namespace metric
}  // namespace rank_metrics
