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

// Evaluates the ranking metrics of a dataset of scored lists.
//
// Usage example:
//   evaluate_ranking \
//     --alsologtostderr \
//     --dataset=/path/to/lists.txtpb \
//     --metrics=/path/to/metrics.txtpb \
//     --output=/path/to/results.txtpb
//
// "--dataset" is a "dataset::proto::RankingDataset" text proto. "--metrics" is
// an optional "metric::proto::MetricSetConfig" text proto. If not set, the
// default metrics are evaluated. If "--output" is set, the
// "metric::proto::EvaluationResults" are also exported as a text proto.
//
#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "rank_metrics/dataset/ranking_dataset.pb.h"
#include "rank_metrics/dataset/ranking_list.h"
#include "rank_metrics/metric/metric.pb.h"
#include "rank_metrics/metric/metric_set.h"
#include "rank_metrics/metric/report.h"
#include "rank_metrics/utils/filesystem.h"
#include "rank_metrics/utils/logging.h"
#include "rank_metrics/utils/protobuf.h"
#include "rank_metrics/utils/status_macros.h"

ABSL_FLAG(std::string, dataset, "",
          "Path to the scored lists. dataset::proto::RankingDataset text "
          "proto.");

ABSL_FLAG(std::string, metrics, "",
          "Path to optional metric configuration. "
          "metric::proto::MetricSetConfig text proto. If not set, the default "
          "metrics are evaluated.");

ABSL_FLAG(std::string, output, "",
          "Optional path to export the evaluation results. "
          "metric::proto::EvaluationResults text proto.");

ABSL_FLAG(int, batch_size, 128, "Number of lists evaluated together.");

constexpr char kUsageMessage[] =
    "Evaluates the ranking metrics of a dataset of scored lists.";

namespace rank_metrics {
namespace cli {

absl::Status Evaluate() {
  // Check required flags.
  if (absl::GetFlag(FLAGS_dataset).empty()) {
    return absl::InvalidArgumentError("--dataset is required.");
  }
  const int batch_size = absl::GetFlag(FLAGS_batch_size);
  STATUS_CHECK_GT(batch_size, 0);

  // Configure the metrics.
  metric::MetricSet metrics;
  if (absl::GetFlag(FLAGS_metrics).empty()) {
    ASSIGN_OR_RETURN(metrics, metric::MetricSet::CreateDefault());
  } else {
    ASSIGN_OR_RETURN(const auto raw_config,
                     file::GetContent(absl::GetFlag(FLAGS_metrics)));
    ASSIGN_OR_RETURN(
        const auto config,
        utils::ParseTextProto<metric::proto::MetricSetConfig>(raw_config));
    ASSIGN_OR_RETURN(metrics, metric::MetricSet::Create(config));
  }

  // Load the lists.
  ASSIGN_OR_RETURN(const auto raw_dataset,
                   file::GetContent(absl::GetFlag(FLAGS_dataset)));
  ASSIGN_OR_RETURN(
      const auto ranking_dataset,
      utils::ParseTextProto<dataset::proto::RankingDataset>(raw_dataset));
  LOG(INFO) << "Evaluating " << metrics.metrics().size() << " metric(s) on "
            << ranking_dataset.lists_size() << " list(s)";

  // Evaluate the lists by batch.
  std::vector<dataset::RankingList> batch;
  std::vector<float> sample_weights;
  const auto flush_batch = [&]() -> absl::Status {
    RETURN_IF_ERROR(metrics.Update(batch, sample_weights));
    batch.clear();
    sample_weights.clear();
    return absl::OkStatus();
  };
  for (const auto& list : ranking_dataset.lists()) {
    batch.push_back(dataset::ListFromProto(list));
    sample_weights.push_back(list.sample_weight());
    if (static_cast<int>(batch.size()) >= batch_size) {
      RETURN_IF_ERROR(flush_batch());
    }
  }
  if (!batch.empty()) {
    RETURN_IF_ERROR(flush_batch());
  }

  const auto results = metrics.Results();
  std::cout << "Evaluation:" << std::endl << metric::TextReport(results);

  if (!absl::GetFlag(FLAGS_output).empty()) {
    ASSIGN_OR_RETURN(const auto serialized_results,
                     utils::SerializeTextProto(results));
    RETURN_IF_ERROR(
        file::SetContent(absl::GetFlag(FLAGS_output), serialized_results));
    LOG(INFO) << "Results exported to " << absl::GetFlag(FLAGS_output);
  }
  return absl::OkStatus();
}

}  // namespace cli
}  // namespace rank_metrics

int main(int argc, char** argv) {
  InitLogging(kUsageMessage, &argc, &argv, true);
  const auto status = rank_metrics::cli::Evaluate();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return 1;
  }
  return 0;
}
