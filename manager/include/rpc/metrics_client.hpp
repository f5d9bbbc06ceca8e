#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "metrics_api.grpc.pb.h"
#include "metrics_api.pb.h"

namespace clustermon {

// MetricsService 客户端，供 clustermon_ctl 使用
class MetricsClient {
 public:
  explicit MetricsClient(const std::string& manager_address = "localhost:50051");
  ~MetricsClient();

  bool get_metrics(clustermon::proto::GetMetricsResponse* response,
                   std::string* error);
  bool mark_benchmark(std::string* error);
  bool reset(std::string* error);
  bool get_collector_stats(clustermon::proto::CollectorStats* stats,
                           std::string* error);

  const std::string& get_manager_address() const { return _manager_address; }

 private:
  std::unique_ptr<clustermon::proto::MetricsService::Stub> _stub_ptr;
  std::string _manager_address;
};

// 采样列表转为 JSON 数组（保持原有顺序，字段名与 proto 字段名一致）
bool samples_to_json(const clustermon::proto::GetMetricsResponse& response,
                     std::string* json, std::string* error);

// {"error": "<message>"}
std::string error_to_json(const std::string& message);

}  // namespace clustermon
