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

#include "rank_metrics/metric/report.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/substitute.h"
#include "rank_metrics/metric/metric.pb.h"

namespace rank_metrics {
namespace metric {

std::string TextReport(const proto::EvaluationResults& results) {
  std::string report;
  AppendTextReport(results, &report);
  return report;
}

void AppendTextReport(const proto::EvaluationResults& results,
                      std::string* report) {
  for (const auto& metric : results.metrics()) {
    absl::SubstituteAndAppend(report, "$0: $1 (weight: $2)\n",
                              metric.config().name(), metric.value(),
                              metric.sum_weights());
  }
  absl::StrAppend(report, "Number of lists: ", results.num_lists(), "\n");
  absl::StrAppend(report, "Number of items: ", results.num_items(),
                  " (valid: ", results.num_valid_items(), ")\n");
  if (results.num_lists() > 0) {
    absl::StrAppend(
        report, "Number of valid items per list: min:",
        results.min_num_valid_items_in_list(),
        " max:", results.max_num_valid_items_in_list(), " mean:",
        static_cast<double>(results.num_valid_items()) / results.num_lists(),
        "\n");
  }
}

}  // namespace metric
}  // namespace rank_metrics
