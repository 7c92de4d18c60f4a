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

// A ranking metric evaluated over a stream of batches of lists.
//
// A "RankingMetric" binds a per-list scoring function (e.g. NDCG@5) to a
// weighted mean accumulator. Each call to "Update" scores the lists of a
// batch and adds them to the running mean.
//
// Usage example:
//   ASSIGN_OR_RETURN(auto metric, GetMetric("ndcg", "ndcg_5", 5));
//   for (const auto& batch : batches) {
//     ASSIGN_OR_RETURN(const double batch_ndcg, metric.Update(batch));
//   }
//   LOG(INFO) << metric.name() << ": " << metric.Result();
//   metric.Reset();
//
// A metric is not thread safe. Batches evaluated in parallel should use
// separate metric objects, combined with "Merge".
//
#ifndef RANK_METRICS_METRIC_RANKING_METRIC_H_
#define RANK_METRICS_METRIC_RANKING_METRIC_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "absl/types/span.h"
#include "rank_metrics/dataset/ranking_list.h"
#include "rank_metrics/metric/list_scorer.h"
#include "rank_metrics/metric/metric.pb.h"
#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"
#include "rank_metrics/metric/weighted_mean.h"
#include "rank_metrics/utils/random.h"

namespace rank_metrics {
namespace metric {

class RankingMetric {
 public:
  // Creates a metric. Fails if the configuration is invalid. If not set, the
  // name of the metric is its key e.g. "ndcg".
  static absl::StatusOr<RankingMetric> Create(
      const proto::MetricConfig& config, const MetricFunctions& functions = {});

  // Scores the lists of a batch and adds them to the running mean. Returns the
  // weighted mean of the batch alone.
  //
  // "sample_weights" multiplies the list weights. It is either empty (weight
  // of 1), a single value broadcasted to all the lists, or one value per
  // list. All the lists are checked before any of them is accumulated.
  absl::StatusOr<double> Update(absl::Span<const dataset::RankingList> lists,
                                absl::Span<const float> sample_weights = {});

  // Scores a single list without changing the running mean.
  absl::StatusOr<ListMetric> EvaluateList(const dataset::RankingList& list);

  // Checks that a list can be scored by this metric.
  absl::Status CheckList(const dataset::RankingList& list) const;

  // Scores an already ranked list and adds it to the running mean. Returns the
  // score of the list before the sample weight is applied.
  ListMetric AddRankedList(const RankedList& list, double sample_weight = 1.);

  // Weighted mean of all the lists accumulated since the creation or the last
  // reset. Zero if no list has a positive weight.
  double Result() const { return accumulator_.Result(); }

  // Sum of the weights of the accumulated lists.
  double TotalWeight() const { return accumulator_.total_weight(); }

  // Clears the running mean and re-seeds the tie breaking random generator.
  void Reset();

  // Adds the running mean of another metric with the same configuration.
  absl::Status Merge(const RankingMetric& other);

  // Snapshot and restoration of the running mean.
  proto::AccumulatorState SaveState() const { return accumulator_.Save(); }
  absl::Status RestoreState(const proto::AccumulatorState& state);

  // Configuration record of the metric. Can be used to re-create the metric
  // with "Create".
  const proto::MetricConfig& config() const { return config_; }

  const std::string& name() const { return config_.name(); }

  proto::MetricKind kind() const { return config_.kind(); }

  // Seed used to break ties, if any.
  absl::optional<int64_t> seed() const;

 private:
  RankingMetric(proto::MetricConfig config, ListScorer scorer);

  // Random generator used to break ties. Null if the metric is not seeded.
  utils::RandomEngine* TieBreaker();

  proto::MetricConfig config_;
  ListScorer scorer_;
  WeightedMeanAccumulator accumulator_;
  utils::RandomEngine rnd_;
};

// Resolves the sample weight of each list of a batch. See
// "RankingMetric::Update" for the supported shapes.
absl::StatusOr<std::vector<double>> BroadcastSampleWeights(
    absl::Span<const float> sample_weights, int num_lists);

// Creates the configuration of a metric from its key (e.g. "mrr"). Fails with
// "Unsupported metric" if the key is unknown.
absl::StatusOr<proto::MetricConfig> MetricConfigFromKey(
    absl::string_view key, absl::string_view name = {},
    absl::optional<int> topn = {});

// Creates a metric from its key.
absl::StatusOr<RankingMetric> GetMetric(absl::string_view key,
                                        absl::string_view name = {},
                                        absl::optional<int> topn = {});

// Configuration of the default set of ranking metrics: NDCG@{1,3,5,10}, ARP,
// OPA, MRR, Precision, MAP, DCG and NDCG.
std::vector<proto::MetricConfig> DefaultMetricConfigs();

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_RANKING_METRIC_H_
