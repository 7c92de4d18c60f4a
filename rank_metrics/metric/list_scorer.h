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

// Per-list scoring function of a ranking metric.
//
// A "ListScorer" holds one of the per-list metric calculators, configured
// from a "proto::MetricConfig". All the calculators expose the same
// "ListMetric Compute(const RankedList&) const" method.
//
#ifndef RANK_METRICS_METRIC_LIST_SCORER_H_
#define RANK_METRICS_METRIC_LIST_SCORER_H_

#include <string>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "rank_metrics/dataset/ranking_list.h"
#include "rank_metrics/metric/metric.pb.h"
#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_alpha_dcg.h"
#include "rank_metrics/metric/ranking_ap.h"
#include "rank_metrics/metric/ranking_arp.h"
#include "rank_metrics/metric/ranking_mrr.h"
#include "rank_metrics/metric/ranking_ndcg.h"
#include "rank_metrics/metric/ranking_opa.h"
#include "rank_metrics/metric/ranking_precision.h"
#include "rank_metrics/metric/ranking_precision_ia.h"
#include "rank_metrics/metric/ranking_utils.h"

namespace rank_metrics {
namespace metric {

using ListScorer =
    std::variant<MRRCalculator, ARPCalculator, PrecisionCalculator,
                 RecallCalculator, APCalculator, DCGCalculator, NDCGCalculator,
                 AlphaDCGCalculator, PrecisionIACalculator, OPACalculator>;

// Custom gain and discount functions. Only used by the DCG, NDCG and
// alpha-DCG metrics. Unset functions are replaced by "DefaultGain" and
// "DefaultRankDiscount".
struct MetricFunctions {
  GainFn gain;
  DiscountFn discount;
};

// String key of a metric kind e.g. "ndcg".
std::string MetricKey(proto::MetricKind kind);

// Metric kind from its string key. Fails if the key is not supported.
absl::StatusOr<proto::MetricKind> MetricKindFromKey(absl::string_view key);

// Does the metric require the items to be annotated with subtopics.
bool RequiresSubtopics(proto::MetricKind kind);

// Does the metric support the "topn" cutoff. Metrics without support ignore
// it.
bool SupportsTruncation(proto::MetricKind kind);

// Does the metric support custom gain and discount functions.
bool SupportsCustomFunctions(proto::MetricKind kind);

// Checks the consistency of a metric configuration.
absl::Status ValidateMetricConfig(const proto::MetricConfig& config,
                                  const MetricFunctions& functions = {});

// Validates a configuration and creates the corresponding scorer.
absl::StatusOr<ListScorer> CreateListScorer(
    const proto::MetricConfig& config, const MetricFunctions& functions = {});

// Checks that a list is well formed and contains the data needed by a metric.
absl::Status CheckListForMetric(proto::MetricKind kind,
                                const dataset::RankingList& list);

// Scores a ranked list. A list with less than two valid items is degenerate:
// its value and weight are zero.
ListMetric ScoreList(const ListScorer& scorer, const RankedList& list);

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_LIST_SCORER_H_
