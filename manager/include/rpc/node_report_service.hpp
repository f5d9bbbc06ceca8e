#pragma once

#include <grpcpp/server_context.h>
#include <grpcpp/support/status.h>

#include "node_registry.hpp"
#include "node_report.grpc.pb.h"
#include "node_report.pb.h"

namespace clustermon {

// gRPC 服务实现类 - 接收 worker 推送的节点数据
class NodeReportServiceImpl
    : public clustermon::proto::NodeReportService::Service {
 public:
  explicit NodeReportServiceImpl(NodeRegistry* registry);
  virtual ~NodeReportServiceImpl() = default;

  ::grpc::Status ReportNodeUsage(
      ::grpc::ServerContext* context,
      const ::clustermon::proto::NodeReport* request,
      ::google::protobuf::Empty* response) override;

 private:
  NodeRegistry* _registry;
};

}  // namespace clustermon
