#include "rpc/node_report_service.hpp"

#include "fastlog/fastlog.hpp"

namespace clustermon {

namespace {
constexpr char kManagerLoggerName[] = "manager_file_logger";
}

NodeReportServiceImpl::NodeReportServiceImpl(NodeRegistry* registry)
    : _registry(registry) {}

::grpc::Status NodeReportServiceImpl::ReportNodeUsage(
    ::grpc::ServerContext* context,
    const ::clustermon::proto::NodeReport* request,
    ::google::protobuf::Empty* response) {
  (void)context;
  (void)response;

  if (!request) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Empty request");
  }
  if (!_registry) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE,
                        "Node registry not initialized");
  }

  std::string error;
  if (!_registry->on_report(*request, &error)) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error);
  }

  fastlog::file::get_logger(kManagerLoggerName)->debug("Received node report from: {}", request->node_name());
  return grpc::Status::OK;
}

}  // namespace clustermon
