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

// A set of ranking metrics evaluated on the same stream of batches.
//
// Each list is ranked once per distinct tie breaking seed, and the ranking is
// shared by all the metrics with this seed.
//
// Usage example:
//   ASSIGN_OR_RETURN(auto metrics, MetricSet::CreateDefault());
//   for (const auto& batch : batches) {
//     RETURN_IF_ERROR(metrics.Update(batch));
//   }
//   const proto::EvaluationResults results = metrics.Results();
//
#ifndef RANK_METRICS_METRIC_METRIC_SET_H_
#define RANK_METRICS_METRIC_METRIC_SET_H_

#include <cstdint>
#include <limits>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "absl/types/span.h"
#include "rank_metrics/dataset/ranking_list.h"
#include "rank_metrics/metric/metric.pb.h"
#include "rank_metrics/metric/ranking_metric.h"
#include "rank_metrics/utils/random.h"

namespace rank_metrics {
namespace metric {

class MetricSet {
 public:
  // Creates the metrics of a configuration. Metric names should be unique.
  static absl::StatusOr<MetricSet> Create(const proto::MetricSetConfig& config);

  // Creates the default metrics (see "DefaultMetricConfigs").
  static absl::StatusOr<MetricSet> CreateDefault();

  // Adds a metric. Fails if a metric with the same name already exists.
  absl::Status Add(RankingMetric metric);

  // Scores the lists of a batch with all the metrics. See
  // "RankingMetric::Update" for the definition of "sample_weights".
  absl::Status Update(absl::Span<const dataset::RankingList> lists,
                      absl::Span<const float> sample_weights = {});

  // Current values of the metrics and statistics about the evaluated lists.
  proto::EvaluationResults Results() const;

  // Clears all the metrics and statistics.
  void Reset();

  const std::vector<RankingMetric>& metrics() const { return metrics_; }

 private:
  // Metrics sharing the same tie breaking seed.
  struct SeedGroup {
    absl::optional<int64_t> seed;
    utils::RandomEngine rnd;
    std::vector<int> metric_idxs;
  };

  std::vector<RankingMetric> metrics_;
  std::vector<SeedGroup> seed_groups_;

  int64_t num_lists_ = 0;
  int64_t num_items_ = 0;
  int64_t num_valid_items_ = 0;
  int64_t min_num_valid_items_ = std::numeric_limits<int64_t>::max();
  int64_t max_num_valid_items_ = 0;
};

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_METRIC_SET_H_
