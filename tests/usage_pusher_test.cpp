#include <grpcpp/server_builder.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "node_registry.hpp"
#include "rpc/node_report_service.hpp"
#include "rpc/usage_pusher.hpp"

using namespace clustermon;

// worker 推送到进程内的 NodeReportService
TEST(UsagePusherTest, PushesReportToManager)
{
  NodeRegistry registry;
  NodeReportServiceImpl service(&registry);

  int port = 0;
  grpc::ServerBuilder builder;
  builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(),
                           &port);
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  ASSERT_NE(nullptr, server);
  ASSERT_GT(port, 0);

  UsagePusher pusher("127.0.0.1:" + std::to_string(port), 3600, "pusher-test");
  pusher.start();

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (registry.node_count() == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  // 间隔很长，stop 仍应立即返回
  auto before = std::chrono::steady_clock::now();
  pusher.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(1));

  ASSERT_EQ(1u, registry.node_count());
  int64_t capacity = 0;
  std::string error;
  ASSERT_TRUE(registry.get_node_capacity("pusher-test", &capacity, &error)) << error;
  EXPECT_GE(capacity, 1000);

  std::vector<NodeUsage> usages;
  ASSERT_TRUE(registry.list_node_usage(&usages, &error));
  ASSERT_EQ(1u, usages.size());
  EXPECT_EQ("pusher-test", usages[0].node_name);
  EXPECT_GT(usages[0].memory_used, 0);

  server->Shutdown();
}

TEST(UsagePusherTest, RejectedReportIsInvalidArgument)
{
  NodeRegistry registry;
  NodeReportServiceImpl service(&registry);

  clustermon::proto::NodeReport report;
  report.set_cpu_capacity_millicores(1000);
  google::protobuf::Empty response;
  grpc::Status status = service.ReportNodeUsage(nullptr, &report, &response);
  EXPECT_EQ(grpc::StatusCode::INVALID_ARGUMENT, status.error_code());
  EXPECT_EQ(0u, registry.node_count());
}
