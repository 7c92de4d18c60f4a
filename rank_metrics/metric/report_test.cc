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

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "rank_metrics/metric/metric.pb.h"
#include "rank_metrics/utils/test.h"

namespace rank_metrics {
namespace metric {
namespace {

TEST(Report, TextReport) {
  const proto::EvaluationResults results = PARSE_TEST_PROTO(R"pb(
    metrics {
      config { kind: MRR name: "metric/mrr" }
      value: 0.5
      sum_weights: 3
    }
    metrics {
      config { kind: NDCG topn: 1 name: "metric/ndcg_1" }
      value: 0.25
      sum_weights: 1.5
    }
    num_lists: 3
    num_items: 10
    num_valid_items: 8
    min_num_valid_items_in_list: 2
    max_num_valid_items_in_list: 3
  )pb");
  EXPECT_EQ(TextReport(results),
            "metric/mrr: 0.5 (weight: 3)\n"
            "metric/ndcg_1: 0.25 (weight: 1.5)\n"
            "Number of lists: 3\n"
            "Number of items: 10 (valid: 8)\n"
            "Number of valid items per list: min:2 max:3 mean:2.66667\n");
}

TEST(Report, Empty) {
  const proto::EvaluationResults results = PARSE_TEST_PROTO("num_lists: 0");
  EXPECT_EQ(TextReport(results),
            "Number of lists: 0\n"
            "Number of items: 0 (valid: 0)\n");
}

TEST(Report, AppendTextReport) {
  const proto::EvaluationResults results = PARSE_TEST_PROTO(R"pb(
    num_lists: 1 num_items: 2 num_valid_items: 2
    min_num_valid_items_in_list: 2 max_num_valid_items_in_list: 2
  )pb");
  std::string report = "Evaluation:\n";
  AppendTextReport(results, &report);
  EXPECT_EQ(report,
            "Evaluation:\n"
            "Number of lists: 1\n"
            "Number of items: 2 (valid: 2)\n"
            "Number of valid items per list: min:2 max:2 mean:2\n");
}

}  // namespace
}  // namespace metric
}  // namespace rank_metrics
