#include "rpc/metrics_service.hpp"

#include <string>
#include <vector>

#include "fastlog/fastlog.hpp"

namespace clustermon {

namespace {
constexpr char kManagerLoggerName[] = "manager_file_logger";
}

MetricsServiceImpl::MetricsServiceImpl(MetricStore* store, Collector* collector)
    : _store(store), _collector(collector) {}

void MetricsServiceImpl::set_timestamp(
    ::google::protobuf::Timestamp* ts,
    const std::chrono::system_clock::time_point& tp) {
  auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
  auto nanos =
      std::chrono::duration_cast<std::chrono::nanoseconds>(tp - seconds);
  ts->set_seconds(seconds.time_since_epoch().count());
  ts->set_nanos(static_cast<int32_t>(nanos.count()));
}

::grpc::Status MetricsServiceImpl::GetMetrics(
    ::grpc::ServerContext* context, const ::google::protobuf::Empty* request,
    ::clustermon::proto::GetMetricsResponse* response) {
  (void)context;
  (void)request;

  if (!_store) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE,
                        "Metric store not initialized");
  }

  std::vector<MetricSample> samples;
  std::string error;
  if (!_store->query_all(&samples, &error)) {
    fastlog::file::get_logger(kManagerLoggerName)->error("GetMetrics failed: {}", error);
    return grpc::Status(grpc::StatusCode::INTERNAL, error);
  }

  for (const auto& sample : samples) {
    auto* proto_sample = response->add_samples();
    set_timestamp(proto_sample->mutable_timestamp(), sample.timestamp);
    proto_sample->set_node_name(sample.node_name);
    proto_sample->set_cpu_usage(sample.cpu_usage);
    proto_sample->set_memory_usage(sample.memory_usage);
    proto_sample->set_is_benchmark(sample.is_benchmark);
    proto_sample->set_cluster_cpu_usage(sample.cluster_cpu_usage);
    proto_sample->set_cluster_total_cpu(sample.cluster_total_cpu);
  }

  return grpc::Status::OK;
}

::grpc::Status MetricsServiceImpl::MarkBenchmark(
    ::grpc::ServerContext* context, const ::google::protobuf::Empty* request,
    ::google::protobuf::Empty* response) {
  (void)context;
  (void)request;
  (void)response;

  if (!_store) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE,
                        "Metric store not initialized");
  }

  std::string error;
  if (!_store->mark_benchmark(&error)) {
    fastlog::file::get_logger(kManagerLoggerName)->error("MarkBenchmark failed: {}", error);
    return grpc::Status(grpc::StatusCode::INTERNAL, error);
  }
  return grpc::Status::OK;
}

::grpc::Status MetricsServiceImpl::ResetMetrics(
    ::grpc::ServerContext* context, const ::google::protobuf::Empty* request,
    ::google::protobuf::Empty* response) {
  (void)context;
  (void)request;
  (void)response;

  if (!_store) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE,
                        "Metric store not initialized");
  }

  std::string error;
  if (!_store->reset(&error)) {
    fastlog::file::get_logger(kManagerLoggerName)->error("ResetMetrics failed: {}", error);
    return grpc::Status(grpc::StatusCode::INTERNAL, error);
  }
  return grpc::Status::OK;
}

::grpc::Status MetricsServiceImpl::GetCollectorStats(
    ::grpc::ServerContext* context, const ::google::protobuf::Empty* request,
    ::clustermon::proto::CollectorStats* response) {
  (void)context;
  (void)request;

  if (!_collector) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE,
                        "Collector not initialized");
  }

  CollectorStats stats = _collector->stats();
  response->set_cycles_run(stats.cycles_run);
  response->set_cycles_skipped(stats.cycles_skipped);
  response->set_nodes_skipped(stats.nodes_skipped);
  response->set_rows_written(stats.rows_written);
  response->set_write_failures(stats.write_failures);
  response->set_last_error(stats.last_error);
  response->set_last_cycle_nodes(stats.last_cycle_nodes);
  if (stats.cycles_run > 0) {
    set_timestamp(response->mutable_last_cycle_time(), stats.last_cycle_time);
  }
  return grpc::Status::OK;
}

}  // namespace clustermon
