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

#include "rank_metrics/metric/ranking_metric.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/strings/substitute.h"
#include "absl/types/optional.h"
#include "absl/types/span.h"
#include "google/protobuf/util/message_differencer.h"
#include "rank_metrics/dataset/ranking_list.h"
#include "rank_metrics/metric/list_scorer.h"
#include "rank_metrics/metric/metric.pb.h"
#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/utils/logging.h"
#include "rank_metrics/utils/random.h"
#include "rank_metrics/utils/status_macros.h"

namespace rank_metrics {
namespace metric {

absl::StatusOr<RankingMetric> RankingMetric::Create(
    const proto::MetricConfig& config, const MetricFunctions& functions) {
  ASSIGN_OR_RETURN(auto scorer, CreateListScorer(config, functions));
  proto::MetricConfig effective_config = config;
  if (!effective_config.has_name()) {
    effective_config.set_name(MetricKey(config.kind()));
  }
  return RankingMetric(std::move(effective_config), std::move(scorer));
}

RankingMetric::RankingMetric(proto::MetricConfig config, ListScorer scorer)
    : config_(std::move(config)), scorer_(std::move(scorer)) {
  Reset();
}

absl::optional<int64_t> RankingMetric::seed() const {
  if (!config_.has_seed()) {
    return {};
  }
  return config_.seed();
}

utils::RandomEngine* RankingMetric::TieBreaker() {
  return config_.has_seed() ? &rnd_ : nullptr;
}

void RankingMetric::Reset() {
  accumulator_.Reset();
  if (config_.has_seed()) {
    rnd_.seed(static_cast<utils::RandomEngine::result_type>(config_.seed()));
  }
}

absl::Status RankingMetric::CheckList(const dataset::RankingList& list) const {
  return CheckListForMetric(config_.kind(), list);
}

ListMetric RankingMetric::AddRankedList(const RankedList& list,
                                        const double sample_weight) {
  const ListMetric list_metric = ScoreList(scorer_, list);
  accumulator_.Add(list_metric.value, list_metric.weight * sample_weight);
  return list_metric;
}

absl::StatusOr<double> RankingMetric::Update(
    absl::Span<const dataset::RankingList> lists,
    absl::Span<const float> sample_weights) {
  ASSIGN_OR_RETURN(const auto list_sample_weights,
                   BroadcastSampleWeights(sample_weights, lists.size()));
  for (const auto& list : lists) {
    RETURN_IF_ERROR(CheckList(list));
  }

  WeightedMeanAccumulator batch;
  for (size_t list_idx = 0; list_idx < lists.size(); list_idx++) {
    const RankedList ranked_list(lists[list_idx], TieBreaker());
    const ListMetric list_metric =
        AddRankedList(ranked_list, list_sample_weights[list_idx]);
    batch.Add(list_metric.value,
              list_metric.weight * list_sample_weights[list_idx]);
  }
  return batch.Result();
}

absl::StatusOr<ListMetric> RankingMetric::EvaluateList(
    const dataset::RankingList& list) {
  RETURN_IF_ERROR(CheckList(list));
  const RankedList ranked_list(list, TieBreaker());
  return ScoreList(scorer_, ranked_list);
}

absl::Status RankingMetric::Merge(const RankingMetric& other) {
  if (!google::protobuf::util::MessageDifferencer::Equals(config_,
                                                          other.config_)) {
    return absl::InvalidArgumentError(
        absl::Substitute("Cannot merge the metric \"$0\" into the metric "
                         "\"$1\" as their configurations differ.",
                         other.name(), name()));
  }
  accumulator_.Merge(other.accumulator_);
  return absl::OkStatus();
}

absl::Status RankingMetric::RestoreState(
    const proto::AccumulatorState& state) {
  if (!(state.sum_weights() >= 0.)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid accumulator state for the metric \"", name(),
                     "\": the sum of weights is ", state.sum_weights(), "."));
  }
  accumulator_.Restore(state);
  return absl::OkStatus();
}

absl::StatusOr<std::vector<double>> BroadcastSampleWeights(
    absl::Span<const float> sample_weights, const int num_lists) {
  std::vector<double> list_weights;
  if (sample_weights.empty()) {
    list_weights.assign(num_lists, 1.);
  } else if (sample_weights.size() == 1) {
    list_weights.assign(num_lists, sample_weights[0]);
  } else if (sample_weights.size() == static_cast<size_t>(num_lists)) {
    list_weights.assign(sample_weights.begin(), sample_weights.end());
  } else {
    return absl::InvalidArgumentError(absl::Substitute(
        "$0 sample weights cannot be broadcasted to $1 lists. Expecting zero, "
        "one or $1 sample weights.",
        sample_weights.size(), num_lists));
  }
  for (const double weight : list_weights) {
    if (!(weight >= 0.) || std::isinf(weight)) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Sample weights should be finite and non-negative. Got ", weight));
    }
  }
  return list_weights;
}

absl::StatusOr<proto::MetricConfig> MetricConfigFromKey(
    const absl::string_view key, const absl::string_view name,
    const absl::optional<int> topn) {
  ASSIGN_OR_RETURN(const auto kind, MetricKindFromKey(key));
  proto::MetricConfig config;
  config.set_kind(kind);
  if (!name.empty()) {
    config.set_name(std::string(name));
  }
  if (topn.has_value()) {
    config.set_topn(topn.value());
  }
  return config;
}

absl::StatusOr<RankingMetric> GetMetric(const absl::string_view key,
                                        const absl::string_view name,
                                        const absl::optional<int> topn) {
  ASSIGN_OR_RETURN(const auto config, MetricConfigFromKey(key, name, topn));
  return RankingMetric::Create(config);
}

std::vector<proto::MetricConfig> DefaultMetricConfigs() {
  std::vector<proto::MetricConfig> configs;
  for (const int topn : {1, 3, 5, 10}) {
    proto::MetricConfig config;
    config.set_kind(proto::NDCG);
    config.set_topn(topn);
    config.set_name(absl::StrCat("metric/ndcg_", topn));
    configs.push_back(std::move(config));
  }
  for (const auto kind : {proto::ARP, proto::ORDERED_PAIR_ACCURACY, proto::MRR,
                          proto::PRECISION, proto::MAP, proto::DCG,
                          proto::NDCG}) {
    proto::MetricConfig config;
    config.set_kind(kind);
    config.set_name(absl::StrCat("metric/", MetricKey(kind)));
    configs.push_back(std::move(config));
  }
  return configs;
}

}  // namespace metric
}  // namespace rank_metrics
