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

// In-memory representation of the lists evaluated by the ranking metrics.
//
// A list contains the candidate items of a query. Each item has a relevance
// label, a predicted score, and optionally a weight and a set of subtopics.
// Items with a negative (or NaN) label are padding: they are never ranked
// before a real item and never count as relevant.
//
#ifndef RANK_METRICS_DATASET_RANKING_LIST_H_
#define RANK_METRICS_DATASET_RANKING_LIST_H_

#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "rank_metrics/dataset/ranking_dataset.pb.h"

namespace rank_metrics {
namespace dataset {

struct RankingList {
  // Relevance labels. Negative values are padding.
  std::vector<float> labels;

  // Predicted scores. Same size as "labels".
  std::vector<float> scores;

  // Non-negative item weights. If empty, all the items have a weight of 1.
  std::vector<float> weights;

  // Explicit validity mask. If empty, all the items with a non-negative label
  // are valid. A negative label is always invalid.
  std::vector<bool> valid;

  // "subtopics[i]" are the identifiers of the subtopics covered by the i-th
  // item. Empty if the list is not annotated with subtopics.
  std::vector<std::vector<int>> subtopics;

  int size() const { return static_cast<int>(labels.size()); }

  float weight(const int item) const {
    return weights.empty() ? 1.f : weights[item];
  }

  bool has_subtopics() const { return !subtopics.empty(); }
};

// Checks that all the fields of a list are consistent i.e. have the same size,
// the weights are non-negative and the subtopic ids are non-negative.
absl::Status CheckRankingList(const RankingList& list);

// Builds lists from a dense batch of "num_lists" lists padded to "list_size"
// items. The arrays are row-major with one row per list. "weights" is either
// empty or of the same size as "labels". Padding items should have a negative
// label.
absl::StatusOr<std::vector<RankingList>> ListsFromPaddedBatch(
    int num_lists, int list_size, absl::Span<const float> labels,
    absl::Span<const float> scores, absl::Span<const float> weights = {});

// Converts a list from its proto representation.
RankingList ListFromProto(const proto::List& src);

}  // namespace dataset
}  // namespace rank_metrics

#endif  // RANK_METRICS_DATASET_RANKING_LIST_H_
