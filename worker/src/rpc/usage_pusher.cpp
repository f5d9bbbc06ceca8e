#include "rpc/usage_pusher.hpp"

#include <chrono>
#include "fastlog/fastlog.hpp"

namespace clustermon {

namespace {
constexpr char kWorkerLoggerName[] = "worker_file_logger";
constexpr auto kPushTimeout = std::chrono::seconds(5);
}
UsagePusher::UsagePusher(const std::string& manager_address,
                         int interval_seconds, const std::string& node_name)
    : _manager_address(manager_address),
      _interval_seconds(interval_seconds),
      _running(false) {
  // 创建 gRPC channel 和 stub
  auto channel = grpc::CreateChannel(manager_address,
                                     grpc::InsecureChannelCredentials());
  _stub = clustermon::proto::NodeReportService::NewStub(channel);

  // 创建指标采集器
  _collector = std::make_unique<MetricCollector>(node_name);
}

UsagePusher::~UsagePusher() {
  stop();
}

void UsagePusher::start() {
  if (_running) {
    return;
  }
  _running = true;
  _thread = std::make_unique<std::thread>(&UsagePusher::push_for_loop, this);
  fastlog::file::get_logger(kWorkerLoggerName)->info("UsagePusher started, pushing to {} every {} seconds", _manager_address, _interval_seconds);
}

void UsagePusher::stop() {
  {
    std::lock_guard<std::mutex> lock(_wait_mtx);
    _running = false;
  }
  _wait_cv.notify_all();
  if (_thread && _thread->joinable()) {
    _thread->join();
  }
}

void UsagePusher::push_for_loop() {
  while (_running) {
    if (!push_once()) {
      fastlog::file::get_logger(kWorkerLoggerName)->error("Failed to push node usage to {}", _manager_address);
    }

    // 等待指定间隔，stop() 时立即唤醒
    std::unique_lock<std::mutex> lock(_wait_mtx);
    _wait_cv.wait_for(lock, std::chrono::seconds(_interval_seconds),
                      [this] { return !_running; });
  }
}

bool UsagePusher::push_once() {
  // 采集本节点数据
  clustermon::proto::NodeReport report;
  _collector->collect_all(&report);

  fastlog::file::get_logger(kWorkerLoggerName)->debug("[{}] CPU: {}/{}m, Memory: {}/{} bytes",
                        report.node_name(), report.cpu_used_millicores(),
                        report.cpu_capacity_millicores(), report.memory_used_bytes(),
                        report.memory_total_bytes());

  // 推送数据
  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + kPushTimeout);
  google::protobuf::Empty response;

  grpc::Status status = _stub->ReportNodeUsage(&context, report, &response);

  if (status.ok()) {
    fastlog::file::get_logger(kWorkerLoggerName)->debug("Pushed node usage to {} successfully", _manager_address);
    return true;
  } else {
    fastlog::file::get_logger(kWorkerLoggerName)->error("Push failed: {}", status.error_message());
    return false;
  }
}

}
