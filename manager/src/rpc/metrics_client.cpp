#include "rpc/metrics_client.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

namespace clustermon {

MetricsClient::MetricsClient(const std::string& manager_address)
    : _manager_address(manager_address) {
  auto channel =
      grpc::CreateChannel(manager_address, grpc::InsecureChannelCredentials());
  _stub_ptr = clustermon::proto::MetricsService::NewStub(channel);
}

MetricsClient::~MetricsClient() {}

bool MetricsClient::get_metrics(clustermon::proto::GetMetricsResponse* response,
                                std::string* error) {
  ::grpc::ClientContext context;
  ::google::protobuf::Empty request;
  ::grpc::Status status = _stub_ptr->GetMetrics(&context, request, response);
  if (!status.ok()) {
    if (error) *error = status.error_message();
    return false;
  }
  return true;
}

bool MetricsClient::mark_benchmark(std::string* error) {
  ::grpc::ClientContext context;
  ::google::protobuf::Empty request;
  ::google::protobuf::Empty response;
  ::grpc::Status status = _stub_ptr->MarkBenchmark(&context, request, &response);
  if (!status.ok()) {
    if (error) *error = status.error_message();
    return false;
  }
  return true;
}

bool MetricsClient::reset(std::string* error) {
  ::grpc::ClientContext context;
  ::google::protobuf::Empty request;
  ::google::protobuf::Empty response;
  ::grpc::Status status = _stub_ptr->ResetMetrics(&context, request, &response);
  if (!status.ok()) {
    if (error) *error = status.error_message();
    return false;
  }
  return true;
}

bool MetricsClient::get_collector_stats(clustermon::proto::CollectorStats* stats,
                                        std::string* error) {
  ::grpc::ClientContext context;
  ::google::protobuf::Empty request;
  ::grpc::Status status = _stub_ptr->GetCollectorStats(&context, request, stats);
  if (!status.ok()) {
    if (error) *error = status.error_message();
    return false;
  }
  return true;
}

bool samples_to_json(const clustermon::proto::GetMetricsResponse& response,
                     std::string* json, std::string* error) {
  // int64 在 proto JSON 映射中输出为字符串，这里按数字输出
  google::protobuf::ListValue list;
  for (const auto& sample : response.samples()) {
    auto& fields = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["timestamp"].set_string_value(
        google::protobuf::util::TimeUtil::ToString(sample.timestamp()));
    fields["node_name"].set_string_value(sample.node_name());
    fields["cpu_usage"].set_number_value(sample.cpu_usage());
    fields["memory_usage"].set_number_value(
        static_cast<double>(sample.memory_usage()));
    fields["is_benchmark"].set_bool_value(sample.is_benchmark());
    fields["cluster_cpu_usage"].set_number_value(sample.cluster_cpu_usage());
    fields["cluster_total_cpu"].set_number_value(
        static_cast<double>(sample.cluster_total_cpu()));
  }

  std::string out;
  auto status = google::protobuf::util::MessageToJsonString(list, &out);
  if (!status.ok()) {
    if (error) *error = std::string(status.message());
    return false;
  }
  *json = std::move(out);
  return true;
}

std::string error_to_json(const std::string& message) {
  google::protobuf::Struct body;
  (*body.mutable_fields())["error"].set_string_value(message);

  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(body, &json);
  if (!status.ok()) {
    return "{\"error\":\"internal error\"}";
  }
  return json;
}

}  // namespace clustermon
