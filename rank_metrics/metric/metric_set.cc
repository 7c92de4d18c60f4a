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

#include "rank_metrics/metric/metric_set.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "rank_metrics/dataset/ranking_list.h"
#include "rank_metrics/metric/metric.pb.h"
#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_metric.h"
#include "rank_metrics/utils/random.h"
#include "rank_metrics/utils/status_macros.h"

namespace rank_metrics {
namespace metric {
namespace {

void SeedEngine(const absl::optional<int64_t>& seed,
                utils::RandomEngine* rnd) {
  if (seed.has_value()) {
    rnd->seed(static_cast<utils::RandomEngine::result_type>(seed.value()));
  }
}

}  // namespace

absl::StatusOr<MetricSet> MetricSet::Create(
    const proto::MetricSetConfig& config) {
  MetricSet metric_set;
  for (const auto& metric_config : config.metrics()) {
    ASSIGN_OR_RETURN(auto metric, RankingMetric::Create(metric_config));
    RETURN_IF_ERROR(metric_set.Add(std::move(metric)));
  }
  return metric_set;
}

absl::StatusOr<MetricSet> MetricSet::CreateDefault() {
  proto::MetricSetConfig config;
  for (const auto& metric_config : DefaultMetricConfigs()) {
    *config.add_metrics() = metric_config;
  }
  return Create(config);
}

absl::Status MetricSet::Add(RankingMetric metric) {
  for (const auto& existing_metric : metrics_) {
    if (existing_metric.name() == metric.name()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicated metric name \"", metric.name(), "\"."));
    }
  }

  const auto seed = metric.seed();
  auto group_it = std::find_if(
      seed_groups_.begin(), seed_groups_.end(),
      [&seed](const SeedGroup& group) { return group.seed == seed; });
  if (group_it == seed_groups_.end()) {
    SeedGroup group;
    group.seed = seed;
    SeedEngine(seed, &group.rnd);
    seed_groups_.push_back(std::move(group));
    group_it = seed_groups_.end() - 1;
  }
  group_it->metric_idxs.push_back(static_cast<int>(metrics_.size()));
  metrics_.push_back(std::move(metric));
  return absl::OkStatus();
}

absl::Status MetricSet::Update(absl::Span<const dataset::RankingList> lists,
                               absl::Span<const float> sample_weights) {
  ASSIGN_OR_RETURN(const auto list_sample_weights,
                   BroadcastSampleWeights(sample_weights, lists.size()));
  for (const auto& list : lists) {
    // The statistics below read every list, even without metrics.
    RETURN_IF_ERROR(dataset::CheckRankingList(list));
    for (const auto& metric : metrics_) {
      RETURN_IF_ERROR(metric.CheckList(list));
    }
  }

  for (size_t list_idx = 0; list_idx < lists.size(); list_idx++) {
    const auto& list = lists[list_idx];
    for (auto& group : seed_groups_) {
      const RankedList ranked_list(
          list, group.seed.has_value() ? &group.rnd : nullptr);
      for (const int metric_idx : group.metric_idxs) {
        metrics_[metric_idx].AddRankedList(ranked_list,
                                           list_sample_weights[list_idx]);
      }
    }

    const auto valid = ValidityMask(list);
    const int64_t num_valid_items =
        std::count(valid.begin(), valid.end(), true);
    num_lists_++;
    num_items_ += list.size();
    num_valid_items_ += num_valid_items;
    min_num_valid_items_ = std::min(min_num_valid_items_, num_valid_items);
    max_num_valid_items_ = std::max(max_num_valid_items_, num_valid_items);
  }
  return absl::OkStatus();
}

proto::EvaluationResults MetricSet::Results() const {
  proto::EvaluationResults results;
  for (const auto& metric : metrics_) {
    auto* metric_result = results.add_metrics();
    *metric_result->mutable_config() = metric.config();
    metric_result->set_value(metric.Result());
    metric_result->set_sum_weights(metric.TotalWeight());
  }
  results.set_num_lists(num_lists_);
  results.set_num_items(num_items_);
  results.set_num_valid_items(num_valid_items_);
  if (num_lists_ > 0) {
    results.set_min_num_valid_items_in_list(min_num_valid_items_);
    results.set_max_num_valid_items_in_list(max_num_valid_items_);
  }
  return results;
}

void MetricSet::Reset() {
  for (auto& metric : metrics_) {
    metric.Reset();
  }
  for (auto& group : seed_groups_) {
    SeedEngine(group.seed, &group.rnd);
  }
  num_lists_ = 0;
  num_items_ = 0;
  num_valid_items_ = 0;
  min_num_valid_items_ = std::numeric_limits<int64_t>::max();
  max_num_valid_items_ = 0;
}

}  // namespace metric
}  // namespace rank_metrics
