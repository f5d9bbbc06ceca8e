#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>

#include "mocks.hpp"
#include "rpc/metrics_service.hpp"

using namespace clustermon;

using testing::_;
using testing::DoAll;
using testing::NiceMock;
using testing::Return;
using testing::SetArgPointee;

namespace {

MetricSample make_sample(int64_t id, const std::string& node, bool benchmark) {
  MetricSample sample;
  sample.id = id;
  sample.timestamp = std::chrono::system_clock::time_point(
      std::chrono::seconds(1700000000) + std::chrono::microseconds(250000));
  sample.node_name = node;
  sample.cpu_usage = 42.5;
  sample.memory_usage = 1024;
  sample.is_benchmark = benchmark;
  sample.cluster_cpu_usage = 33.0;
  sample.cluster_total_cpu = 3000;
  return sample;
}

}  // namespace

TEST(MetricsServiceTest, GetMetricsKeepsStoreOrder)
{
  MockMetricStore store;
  std::vector<MetricSample> rows = {make_sample(3, "node-b", true),
                                    make_sample(2, "node-a", false)};
  EXPECT_CALL(store, query_all(_, _))
    .WillOnce(DoAll(SetArgPointee<0>(rows), Return(true)));

  MetricsServiceImpl service(&store, nullptr);
  google::protobuf::Empty request;
  clustermon::proto::GetMetricsResponse response;
  grpc::Status status = service.GetMetrics(nullptr, &request, &response);

  ASSERT_TRUE(status.ok());
  ASSERT_EQ(2, response.samples_size());
  const auto& first = response.samples(0);
  EXPECT_EQ("node-b", first.node_name());
  EXPECT_TRUE(first.is_benchmark());
  EXPECT_DOUBLE_EQ(42.5, first.cpu_usage());
  EXPECT_EQ(1024, first.memory_usage());
  EXPECT_DOUBLE_EQ(33.0, first.cluster_cpu_usage());
  EXPECT_EQ(3000, first.cluster_total_cpu());
  EXPECT_EQ(1700000000, first.timestamp().seconds());
  EXPECT_EQ(250000000, first.timestamp().nanos());
  EXPECT_EQ("node-a", response.samples(1).node_name());
  EXPECT_FALSE(response.samples(1).is_benchmark());
}

TEST(MetricsServiceTest, GetMetricsEmpty)
{
  MockMetricStore store;
  EXPECT_CALL(store, query_all(_, _))
    .WillOnce(DoAll(SetArgPointee<0>(std::vector<MetricSample>{}), Return(true)));

  MetricsServiceImpl service(&store, nullptr);
  google::protobuf::Empty request;
  clustermon::proto::GetMetricsResponse response;
  ASSERT_TRUE(service.GetMetrics(nullptr, &request, &response).ok());
  EXPECT_EQ(0, response.samples_size());
}

TEST(MetricsServiceTest, StoreFailureMapsToInternal)
{
  MockMetricStore store;
  EXPECT_CALL(store, query_all(_, _))
    .WillOnce(DoAll(SetArgPointee<1>(std::string("Failed to query: gone away")),
                    Return(false)));
  EXPECT_CALL(store, mark_benchmark(_))
    .WillOnce(DoAll(SetArgPointee<0>(std::string("Failed to insert")), Return(false)));
  EXPECT_CALL(store, reset(_))
    .WillOnce(DoAll(SetArgPointee<0>(std::string("Failed to delete records: x")),
                    Return(false)));

  MetricsServiceImpl service(&store, nullptr);
  google::protobuf::Empty request;
  google::protobuf::Empty empty;
  clustermon::proto::GetMetricsResponse response;

  grpc::Status status = service.GetMetrics(nullptr, &request, &response);
  EXPECT_EQ(grpc::StatusCode::INTERNAL, status.error_code());
  EXPECT_EQ("Failed to query: gone away", status.error_message());

  status = service.MarkBenchmark(nullptr, &request, &empty);
  EXPECT_EQ(grpc::StatusCode::INTERNAL, status.error_code());
  EXPECT_EQ("Failed to insert", status.error_message());

  status = service.ResetMetrics(nullptr, &request, &empty);
  EXPECT_EQ(grpc::StatusCode::INTERNAL, status.error_code());
  EXPECT_EQ("Failed to delete records: x", status.error_message());
}

TEST(MetricsServiceTest, MarkBenchmarkAndResetDelegate)
{
  MockMetricStore store;
  EXPECT_CALL(store, mark_benchmark(_)).WillOnce(Return(true));
  EXPECT_CALL(store, reset(_)).WillOnce(Return(true));

  MetricsServiceImpl service(&store, nullptr);
  google::protobuf::Empty request;
  google::protobuf::Empty response;
  EXPECT_TRUE(service.MarkBenchmark(nullptr, &request, &response).ok());
  EXPECT_TRUE(service.ResetMetrics(nullptr, &request, &response).ok());
}

TEST(MetricsServiceTest, MissingStoreIsUnavailable)
{
  MetricsServiceImpl service(nullptr, nullptr);
  google::protobuf::Empty request;
  clustermon::proto::GetMetricsResponse response;
  EXPECT_EQ(grpc::StatusCode::UNAVAILABLE,
            service.GetMetrics(nullptr, &request, &response).error_code());

  clustermon::proto::CollectorStats stats;
  EXPECT_EQ(grpc::StatusCode::UNAVAILABLE,
            service.GetCollectorStats(nullptr, &request, &stats).error_code());
}

TEST(MetricsServiceTest, CollectorStats)
{
  NiceMock<MockNodeMetricsProvider> provider;
  NiceMock<MockMetricStore> store;
  EXPECT_CALL(provider, list_node_usage(_, _))
    .WillOnce(DoAll(SetArgPointee<1>(std::string("provider down")), Return(false)));

  Collector collector(&provider, &store, std::chrono::milliseconds(1000));
  collector.run_cycle();

  MetricsServiceImpl service(&store, &collector);
  google::protobuf::Empty request;
  clustermon::proto::CollectorStats stats;
  ASSERT_TRUE(service.GetCollectorStats(nullptr, &request, &stats).ok());
  EXPECT_EQ(1u, stats.cycles_run());
  EXPECT_EQ(1u, stats.cycles_skipped());
  EXPECT_EQ(0u, stats.rows_written());
  EXPECT_EQ("provider down", stats.last_error());
  EXPECT_TRUE(stats.has_last_cycle_time());
}
