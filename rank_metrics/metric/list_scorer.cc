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

#include "rank_metrics/metric/list_scorer.h"

#include <string>
#include <utility>
#include <variant>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "rank_metrics/dataset/ranking_list.h"
#include "rank_metrics/metric/metric.pb.h"
#include "rank_metrics/metric/ranked_list.h"
#include "rank_metrics/metric/ranking_utils.h"
#include "rank_metrics/utils/logging.h"
#include "rank_metrics/utils/status_macros.h"

namespace rank_metrics {
namespace metric {
namespace {

constexpr proto::MetricKind kAllKinds[] = {
    proto::MRR,       proto::ARP,          proto::PRECISION,
    proto::RECALL,    proto::MAP,          proto::DCG,
    proto::NDCG,      proto::ALPHA_DCG,    proto::PRECISION_IA,
    proto::ORDERED_PAIR_ACCURACY};

int Truncation(const proto::MetricConfig& config) {
  return config.has_topn() ? config.topn() : kNoTruncation;
}

GainFn GainOrDefault(const MetricFunctions& functions) {
  return functions.gain ? functions.gain : GainFn(DefaultGain);
}

DiscountFn DiscountOrDefault(const MetricFunctions& functions) {
  return functions.discount ? functions.discount
                            : DiscountFn(DefaultRankDiscount);
}

}  // namespace

std::string MetricKey(const proto::MetricKind kind) {
  switch (kind) {
    case proto::UNSPECIFIED:
      return "unspecified";
    case proto::MRR:
      return "mrr";
    case proto::ARP:
      return "arp";
    case proto::PRECISION:
      return "precision";
    case proto::RECALL:
      return "recall";
    case proto::MAP:
      return "map";
    case proto::DCG:
      return "dcg";
    case proto::NDCG:
      return "ndcg";
    case proto::ALPHA_DCG:
      return "alpha_dcg";
    case proto::PRECISION_IA:
      return "precision_ia";
    case proto::ORDERED_PAIR_ACCURACY:
      return "ordered_pair_accuracy";
  }
  return absl::StrCat("unknown_", static_cast<int>(kind));
}

absl::StatusOr<proto::MetricKind> MetricKindFromKey(
    const absl::string_view key) {
  for (const auto kind : kAllKinds) {
    if (key == MetricKey(kind)) {
      return kind;
    }
  }
  return absl::InvalidArgumentError(absl::StrCat("Unsupported metric: ", key));
}

bool RequiresSubtopics(const proto::MetricKind kind) {
  return kind == proto::ALPHA_DCG || kind == proto::PRECISION_IA;
}

bool SupportsTruncation(const proto::MetricKind kind) {
  return kind != proto::ARP && kind != proto::ORDERED_PAIR_ACCURACY;
}

bool SupportsCustomFunctions(const proto::MetricKind kind) {
  return kind == proto::DCG || kind == proto::NDCG ||
         kind == proto::ALPHA_DCG;
}

absl::Status ValidateMetricConfig(const proto::MetricConfig& config,
                                  const MetricFunctions& functions) {
  if (!config.has_kind() || config.kind() == proto::UNSPECIFIED) {
    return absl::InvalidArgumentError("The metric kind is not set.");
  }
  if (!proto::MetricKind_IsValid(config.kind())) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unsupported metric kind: ", config.kind()));
  }
  const auto key = MetricKey(config.kind());
  if (config.has_topn() && config.topn() <= 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "The topn of the metric \"", key, "\" should be positive. Got ",
        config.topn(), "."));
  }
  if (!(config.alpha() >= 0.f && config.alpha() <= 1.f)) {
    return absl::InvalidArgumentError(
        absl::StrCat("The alpha of the metric \"", key,
                     "\" should be in [0, 1]. Got ", config.alpha(), "."));
  }
  if ((functions.gain || functions.discount) &&
      !SupportsCustomFunctions(config.kind())) {
    return absl::InvalidArgumentError(
        absl::StrCat("The metric \"", key,
                     "\" does not support custom gain or discount functions."));
  }
  return absl::OkStatus();
}

absl::StatusOr<ListScorer> CreateListScorer(const proto::MetricConfig& config,
                                            const MetricFunctions& functions) {
  RETURN_IF_ERROR(ValidateMetricConfig(config, functions));
  if (config.has_topn() && !SupportsTruncation(config.kind())) {
    LOG(WARNING) << "The metric \"" << MetricKey(config.kind())
                 << "\" does not support a cutoff. topn=" << config.topn()
                 << " is ignored.";
  }
  const int truncation = Truncation(config);
  switch (config.kind()) {
    case proto::MRR:
      return ListScorer(MRRCalculator(truncation));
    case proto::ARP:
      return ListScorer(ARPCalculator());
    case proto::PRECISION:
      return ListScorer(PrecisionCalculator(truncation));
    case proto::RECALL:
      return ListScorer(RecallCalculator(truncation));
    case proto::MAP:
      return ListScorer(APCalculator(truncation));
    case proto::DCG:
      return ListScorer(DCGCalculator(truncation, GainOrDefault(functions),
                                      DiscountOrDefault(functions)));
    case proto::NDCG:
      return ListScorer(NDCGCalculator(truncation, GainOrDefault(functions),
                                       DiscountOrDefault(functions)));
    case proto::ALPHA_DCG:
      return ListScorer(AlphaDCGCalculator(truncation, config.alpha(),
                                           GainOrDefault(functions),
                                           DiscountOrDefault(functions)));
    case proto::PRECISION_IA:
      return ListScorer(PrecisionIACalculator(truncation));
    case proto::ORDERED_PAIR_ACCURACY:
      return ListScorer(OPACalculator());
    case proto::UNSPECIFIED:
      break;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unsupported metric kind: ", config.kind()));
}

absl::Status CheckListForMetric(const proto::MetricKind kind,
                                const dataset::RankingList& list) {
  RETURN_IF_ERROR(dataset::CheckRankingList(list));
  if (RequiresSubtopics(kind) && !list.has_subtopics()) {
    return absl::InvalidArgumentError(
        absl::StrCat("The metric \"", MetricKey(kind),
                     "\" requires the items to be annotated with subtopics."));
  }
  return absl::OkStatus();
}

ListMetric ScoreList(const ListScorer& scorer, const RankedList& list) {
  if (list.num_valid() < 2) {
    return {};
  }
  return std::visit(
      [&list](const auto& calculator) { return calculator.Compute(list); },
      scorer);
}

}  // namespace metric
}  // namespace rank_metrics
