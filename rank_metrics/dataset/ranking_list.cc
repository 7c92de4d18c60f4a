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

#include "rank_metrics/dataset/ranking_list.h"

#include <cmath>
#include <cstddef>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "absl/types/span.h"
#include "rank_metrics/dataset/ranking_dataset.pb.h"
#include "rank_metrics/utils/status_macros.h"

namespace rank_metrics {
namespace dataset {
namespace {

absl::Status CheckSize(const size_t size, const int expected_size,
                       const char* field_name) {
  if (size != static_cast<size_t>(expected_size)) {
    return absl::InvalidArgumentError(absl::Substitute(
        "The list has $0 labels but $1 $2. Both should be equal.",
        expected_size, size, field_name));
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status CheckRankingList(const RankingList& list) {
  RETURN_IF_ERROR(CheckSize(list.scores.size(), list.size(), "scores"));
  if (!list.weights.empty()) {
    RETURN_IF_ERROR(CheckSize(list.weights.size(), list.size(), "weights"));
    for (const float weight : list.weights) {
      if (!(weight >= 0.f) || std::isinf(weight)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Item weights should be finite and non-negative. Got ",
                         weight));
      }
    }
  }
  if (!list.valid.empty()) {
    RETURN_IF_ERROR(CheckSize(list.valid.size(), list.size(), "mask values"));
  }
  if (list.has_subtopics()) {
    RETURN_IF_ERROR(
        CheckSize(list.subtopics.size(), list.size(), "subtopic sets"));
    for (const auto& item_subtopics : list.subtopics) {
      for (const int subtopic : item_subtopics) {
        if (subtopic < 0) {
          return absl::InvalidArgumentError(absl::StrCat(
              "Subtopic ids should be non-negative. Got ", subtopic));
        }
      }
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<std::vector<RankingList>> ListsFromPaddedBatch(
    const int num_lists, const int list_size, absl::Span<const float> labels,
    absl::Span<const float> scores, absl::Span<const float> weights) {
  STATUS_CHECK_GE(num_lists, 0);
  STATUS_CHECK_GE(list_size, 0);
  const size_t num_values = static_cast<size_t>(num_lists) * list_size;
  if (labels.size() != num_values || scores.size() != num_values) {
    return absl::InvalidArgumentError(absl::Substitute(
        "A batch of $0 lists of $1 items requires $2 labels and scores. Got "
        "$3 labels and $4 scores.",
        num_lists, list_size, num_values, labels.size(), scores.size()));
  }
  if (!weights.empty() && weights.size() != num_values) {
    return absl::InvalidArgumentError(absl::Substitute(
        "A batch of $0 lists of $1 items requires $2 weights. Got $3.",
        num_lists, list_size, num_values, weights.size()));
  }

  std::vector<RankingList> lists(num_lists);
  for (int list_idx = 0; list_idx < num_lists; list_idx++) {
    const size_t begin = static_cast<size_t>(list_idx) * list_size;
    auto& list = lists[list_idx];
    list.labels.assign(labels.begin() + begin,
                       labels.begin() + begin + list_size);
    list.scores.assign(scores.begin() + begin,
                       scores.begin() + begin + list_size);
    if (!weights.empty()) {
      list.weights.assign(weights.begin() + begin,
                          weights.begin() + begin + list_size);
    }
    RETURN_IF_ERROR(CheckRankingList(list));
  }
  return lists;
}

RankingList ListFromProto(const proto::List& src) {
  RankingList list;
  list.labels.reserve(src.items_size());
  list.scores.reserve(src.items_size());

  bool has_weights = false;
  bool has_subtopics = false;
  for (const auto& item : src.items()) {
    has_weights |= item.has_weight();
    has_subtopics |= item.subtopics_size() > 0;
  }

  for (const auto& item : src.items()) {
    list.labels.push_back(item.label());
    list.scores.push_back(item.score());
    if (has_weights) {
      list.weights.push_back(item.weight());
    }
    if (has_subtopics) {
      list.subtopics.emplace_back(item.subtopics().begin(),
                                  item.subtopics().end());
    }
  }
  return list;
}

}  // namespace dataset
}  // namespace rank_metrics
