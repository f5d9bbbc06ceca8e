#pragma once

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "monitor/metric_collector.hpp"
#include "node_report.grpc.pb.h"
#include "node_report.pb.h"


namespace clustermon {

/**
 * 节点用量推送器
 * 
 * 每隔指定间隔采集本节点 CPU/内存用量与容量，
 * 并通过 gRPC 推送给管理者服务器。推送失败在下一个间隔重试。
 */
class UsagePusher {
 public:

  UsagePusher(const std::string& manager_address, int interval_seconds = 10,
              const std::string& node_name = "");
  ~UsagePusher();

  // 启动推送线程
  void start();

  // 停止推送
  void stop();

  // 获取管理者地址
  const std::string& get_manager_address() const { return _manager_address; }

 private:
  void push_for_loop();
  bool push_once();

  std::string _manager_address;  
  int _interval_seconds;
  std::atomic<bool> _running;
  std::mutex _wait_mtx;
  std::condition_variable _wait_cv;
  std::unique_ptr<std::thread> _thread;
  std::unique_ptr<MetricCollector> _collector;
  std::unique_ptr<clustermon::proto::NodeReportService::Stub> _stub;
};

}  // namespace clustermon
