#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "cluster_aggregate.hpp"
#include "metric_store.hpp"
#include "node_metrics_provider.hpp"

namespace clustermon {

// 单个采集周期的结果
struct CycleReport {
  bool skipped = false;  // 节点列表获取失败，整个周期跳过
  int listed_nodes = 0;
  int resolved_nodes = 0;
  int skipped_nodes = 0;
  int rows_written = 0;
  int write_failures = 0;
  ClusterAggregate aggregate;
  std::string last_error;
};

// 累计统计
struct CollectorStats {
  uint64_t cycles_run = 0;
  uint64_t cycles_skipped = 0;
  uint64_t nodes_skipped = 0;
  uint64_t rows_written = 0;
  uint64_t write_failures = 0;
  int last_cycle_nodes = 0;
  std::string last_error;
  std::chrono::system_clock::time_point last_cycle_time;
};

// 周期性地从 NodeMetricsProvider 拉取节点用量，计算集群汇总并逐行写入 MetricStore。
// provider 与 store 由调用方持有，生命周期需长于 Collector。
class Collector {
 public:
  Collector(NodeMetricsProvider* provider, MetricStore* store,
            std::chrono::milliseconds interval);
  ~Collector();

  // 启动采集线程
  void start();

  // 停止采集；正在进行的周期会先完成
  void stop();

  bool is_running() const { return _running; }

  // 执行一次采集
  CycleReport run_cycle();

  CollectorStats stats();

 private:
  void collect_for_loop();
  void record(const CycleReport& report);

  NodeMetricsProvider* _provider;
  MetricStore* _store;
  std::chrono::milliseconds _interval;

  std::mutex _stats_mtx;
  CollectorStats _stats;

  std::atomic<bool> _running;
  std::mutex _wait_mtx;
  std::condition_variable _wait_cv;
  std::unique_ptr<std::thread> _thread;
};

}  // namespace clustermon
