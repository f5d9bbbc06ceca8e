#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace clustermon {

// 一个节点在一个采集周期内的采样行
struct MetricSample {
  int64_t id = 0;  // 由存储层分配，写入前为 0
  std::chrono::system_clock::time_point timestamp;
  std::string node_name;
  double cpu_usage = 0;       // 节点 CPU 使用率（%）
  int64_t memory_usage = 0;   // 字节
  bool is_benchmark = false;
  double cluster_cpu_usage = 0;   // 本周期集群 CPU 使用率（%）
  int64_t cluster_total_cpu = 0;  // 本周期集群 CPU 总容量（millicore）
};

// 节点当前用量
struct NodeUsage {
  std::string node_name;
  int64_t cpu_used = 0;     // millicore
  int64_t memory_used = 0;  // 字节
};

}  // namespace clustermon
