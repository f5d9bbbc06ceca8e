#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "rpc/metrics_client.hpp"

using namespace clustermon;

using testing::HasSubstr;

namespace {

void fill_sample(clustermon::proto::MetricSample* sample,
                 const std::string& node, bool benchmark) {
  sample->mutable_timestamp()->set_seconds(1700000000);
  sample->mutable_timestamp()->set_nanos(250000000);
  sample->set_node_name(node);
  sample->set_cpu_usage(42.5);
  sample->set_memory_usage(1024);
  sample->set_is_benchmark(benchmark);
  sample->set_cluster_cpu_usage(37.5);
  sample->set_cluster_total_cpu(3000);
}

}  // namespace

TEST(MetricsJsonTest, EmptyResponseIsEmptyArray)
{
  clustermon::proto::GetMetricsResponse response;
  std::string json;
  std::string error;
  ASSERT_TRUE(samples_to_json(response, &json, &error));
  EXPECT_EQ("[]", json);
}

TEST(MetricsJsonTest, UsesProtoFieldNames)
{
  clustermon::proto::GetMetricsResponse response;
  fill_sample(response.add_samples(), "node-a", false);

  std::string json;
  std::string error;
  ASSERT_TRUE(samples_to_json(response, &json, &error));

  EXPECT_EQ('[', json.front());
  EXPECT_EQ(']', json.back());
  EXPECT_THAT(json, HasSubstr("\"timestamp\":\"2023-11-14T22:13:20.250Z\""));
  EXPECT_THAT(json, HasSubstr("\"node_name\":\"node-a\""));
  EXPECT_THAT(json, HasSubstr("\"cpu_usage\":42.5"));
  EXPECT_THAT(json, HasSubstr("\"memory_usage\":1024"));
  EXPECT_THAT(json, HasSubstr("\"cluster_cpu_usage\":37.5"));
  EXPECT_THAT(json, HasSubstr("\"cluster_total_cpu\":3000"));
  // false 也要输出
  EXPECT_THAT(json, HasSubstr("\"is_benchmark\":false"));
}

TEST(MetricsJsonTest, IntegersPrintAsNumbers)
{
  clustermon::proto::GetMetricsResponse response;
  fill_sample(response.add_samples(), "node-a", false);
  response.mutable_samples(0)->set_memory_usage(17179869184);
  response.mutable_samples(0)->set_cluster_total_cpu(64000);

  std::string json;
  std::string error;
  ASSERT_TRUE(samples_to_json(response, &json, &error));
  EXPECT_THAT(json, HasSubstr("\"memory_usage\":17179869184"));
  EXPECT_THAT(json, HasSubstr("\"cluster_total_cpu\":64000"));
  EXPECT_THAT(json, testing::Not(HasSubstr("\"17179869184\"")));
}

TEST(MetricsJsonTest, KeepsSampleOrder)
{
  clustermon::proto::GetMetricsResponse response;
  fill_sample(response.add_samples(), "node-z", true);
  fill_sample(response.add_samples(), "node-a", false);

  std::string json;
  std::string error;
  ASSERT_TRUE(samples_to_json(response, &json, &error));

  auto z = json.find("node-z");
  auto a = json.find("node-a");
  ASSERT_NE(std::string::npos, z);
  ASSERT_NE(std::string::npos, a);
  EXPECT_LT(z, a);
  EXPECT_THAT(json, HasSubstr("\"is_benchmark\":true"));
}

TEST(MetricsJsonTest, ErrorBody)
{
  EXPECT_EQ("{\"error\":\"Failed to delete records: lost connection\"}",
            error_to_json("Failed to delete records: lost connection"));
  EXPECT_THAT(error_to_json("say \"hi\""), HasSubstr("\\\"hi\\\""));
}
