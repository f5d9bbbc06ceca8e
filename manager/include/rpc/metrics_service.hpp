#pragma once

#include <grpcpp/server_context.h>
#include <grpcpp/support/status.h>

#include <chrono>

#include "collector.hpp"
#include "metric_store.hpp"
#include "metrics_api.grpc.pb.h"
#include "metrics_api.pb.h"

namespace clustermon {

// gRPC 指标查询服务，直接委托给 MetricStore。
// 存储失败统一返回 INTERNAL，错误信息即存储层的错误描述。
class MetricsServiceImpl : public clustermon::proto::MetricsService::Service {
 public:
  // collector 可为空，此时 GetCollectorStats 返回 UNAVAILABLE
  MetricsServiceImpl(MetricStore* store, Collector* collector);
  virtual ~MetricsServiceImpl() = default;

  // GET /metrics
  ::grpc::Status GetMetrics(
      ::grpc::ServerContext* context, const ::google::protobuf::Empty* request,
      ::clustermon::proto::GetMetricsResponse* response) override;

  // POST /metrics/benchmark
  ::grpc::Status MarkBenchmark(::grpc::ServerContext* context,
                               const ::google::protobuf::Empty* request,
                               ::google::protobuf::Empty* response) override;

  // POST /metrics/reset
  ::grpc::Status ResetMetrics(::grpc::ServerContext* context,
                              const ::google::protobuf::Empty* request,
                              ::google::protobuf::Empty* response) override;

  ::grpc::Status GetCollectorStats(
      ::grpc::ServerContext* context, const ::google::protobuf::Empty* request,
      ::clustermon::proto::CollectorStats* response) override;

 private:
  // 转换时间点到protobuf Timestamp
  void set_timestamp(::google::protobuf::Timestamp* ts,
                     const std::chrono::system_clock::time_point& tp);

  MetricStore* _store;
  Collector* _collector;
};

}  // namespace clustermon
