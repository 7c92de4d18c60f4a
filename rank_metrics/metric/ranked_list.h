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

// Ordering of the items of a list by decreasing predicted score.
//
// Padding items (see "ranking_list.h") are always ordered after the valid
// items. Ties between valid items are broken with a random draw when a random
// generator is provided, and by item position otherwise. A list is ranked once
// and the resulting "RankedList" can be consumed by any number of metrics.
//
#ifndef RANK_METRICS_METRIC_RANKED_LIST_H_
#define RANK_METRICS_METRIC_RANKED_LIST_H_

#include <algorithm>
#include <vector>

#include "absl/types/span.h"
#include "rank_metrics/dataset/ranking_list.h"
#include "rank_metrics/metric/ranking_utils.h"
#include "rank_metrics/utils/random.h"

namespace rank_metrics {
namespace metric {

// Validity of each item of a list. An item is valid if its label is
// non-negative and, if the list has an explicit mask, if the mask is set.
std::vector<bool> ValidityMask(const dataset::RankingList& list);

// Indices of the items sorted by decreasing score. The valid items come first.
// NaN scores are ordered as -infinity. "rnd" can be null.
std::vector<int> RankOrder(absl::Span<const float> scores,
                           const std::vector<bool>& valid,
                           utils::RandomEngine* rnd);

class RankedList {
 public:
  // Ranks "list". "list" should outlive this object. "rnd" can be null.
  RankedList(const dataset::RankingList& list, utils::RandomEngine* rnd);

  const dataset::RankingList& list() const { return *list_; }

  // Number of valid items. The valid items occupy the first "num_valid()"
  // ranks.
  int num_valid() const { return num_valid_; }

  // Number of ranks considered by a metric with the given truncation.
  int TruncatedSize(const int truncation) const {
    return std::min(truncation, num_valid_);
  }

  bool is_valid(const int item) const { return valid_[item]; }

  // Index of the item at the 0-indexed "rank".
  int item(const int rank) const { return order_[rank]; }

  // Attributes of the item at the 0-indexed "rank".
  float label_at(const int rank) const { return list_->labels[order_[rank]]; }
  float weight_at(const int rank) const { return list_->weight(order_[rank]); }
  const std::vector<int>& subtopics_at(const int rank) const {
    return list_->subtopics[order_[rank]];
  }

  const std::vector<int>& order() const { return order_; }

 private:
  const dataset::RankingList* list_;
  std::vector<bool> valid_;
  std::vector<int> order_;
  int num_valid_ = 0;
};

// Mean weight of the valid relevant items. Returns 0 if there are none.
double MeanRelevantItemWeight(const RankedList& list);

// Sorted subtopics without duplicates.
std::vector<int> UniqueSubtopics(const std::vector<int>& subtopics);

// Mean item weight of the valid items, where each item counts once per
// subtopic it covers. Returns 0 if no valid item covers a subtopic.
double MeanSubtopicCoverageWeight(const RankedList& list);

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_RANKED_LIST_H_
