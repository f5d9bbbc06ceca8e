#pragma once

#include <cstdint>
#include <vector>

#include "metric_sample.hpp"

namespace clustermon {

// 容量已成功解析的节点
struct ResolvedNode {
  NodeUsage usage;
  int64_t cpu_capacity = 0;  // millicore
};

// 一个采集周期的集群汇总
struct ClusterAggregate {
  int64_t total_cpu = 0;
  int64_t used_cpu = 0;
  double cpu_usage = 0;
};

// used / capacity * 100，capacity <= 0 时返回 0
double cpu_percent(int64_t used, int64_t capacity);

// 汇总所有节点；没有节点或总容量为 0 时返回 false
bool aggregate_cluster(const std::vector<ResolvedNode>& nodes,
                       ClusterAggregate* aggregate);

}  // namespace clustermon
