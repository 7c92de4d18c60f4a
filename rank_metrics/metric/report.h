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

// Creation of textual reports of ranking evaluations.

#ifndef RANK_METRICS_METRIC_REPORT_H_
#define RANK_METRICS_METRIC_REPORT_H_

#include <string>

#include "rank_metrics/metric/metric.pb.h"

namespace rank_metrics {
namespace metric {

// Textual report of an evaluation.
//
// Example of report:
//   metric/ndcg_5: 0.8145 (weight: 120)
//   metric/mrr: 0.7236 (weight: 118)
//   Number of lists: 120
//   Number of items: 1200 (valid: 1032)
//   Number of valid items per list: min:2 max:10 mean:8.6
std::string TextReport(const proto::EvaluationResults& results);

void AppendTextReport(const proto::EvaluationResults& results,
                      std::string* report);

}  // namespace metric
}  // namespace rank_metrics

#endif  // RANK_METRICS_METRIC_REPORT_H_
