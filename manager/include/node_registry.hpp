#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "node_metrics_provider.hpp"
#include "node_report.pb.h"

namespace clustermon {

struct NodeEntry {
  clustermon::proto::NodeReport report;
  std::chrono::steady_clock::time_point received_at;
};

// 保存 worker 推送的最新节点数据（推送模式），作为采集器的指标来源。
// 超过 stale_after 未上报的节点不再参与采集，并由后台线程清理。
class NodeRegistry : public NodeMetricsProvider {
 public:
  explicit NodeRegistry(
      std::chrono::seconds stale_after = std::chrono::seconds(30));
  ~NodeRegistry() override;

  // 启动后台清理线程
  void start();
  void stop();

  // 接收 worker 推送的数据（由 gRPC 服务调用）
  bool on_report(const clustermon::proto::NodeReport& report,
                 std::string* error);
  bool on_report(const clustermon::proto::NodeReport& report,
                 std::chrono::steady_clock::time_point received_at,
                 std::string* error);

  bool list_node_usage(std::vector<NodeUsage>* usages,
                       std::string* error) override;
  bool get_node_capacity(const std::string& node_name, int64_t* cpu_capacity,
                         std::string* error) override;

  // 删除过期节点，返回删除数量
  size_t prune_stale();

  size_t node_count();

 private:
  void prune_for_loop();
  bool is_fresh(const NodeEntry& entry,
                std::chrono::steady_clock::time_point now) const;

  std::chrono::seconds _stale_after;
  std::map<std::string, NodeEntry> _nodes;
  bool _ever_reported = false;
  std::mutex _mtx;

  std::atomic<bool> _running;
  std::mutex _wait_mtx;
  std::condition_variable _wait_cv;
  std::unique_ptr<std::thread> _thread;
};

}  // namespace clustermon
