#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "metric_sample.hpp"

namespace clustermon {

// 集群节点指标来源。两个方法都可能因暂时不可用而失败，调用方应视为可恢复。
class NodeMetricsProvider {
 public:
  virtual ~NodeMetricsProvider() = default;

  virtual bool list_node_usage(std::vector<NodeUsage>* usages,
                               std::string* error) = 0;

  virtual bool get_node_capacity(const std::string& node_name,
                                 int64_t* cpu_capacity,
                                 std::string* error) = 0;
};

}  // namespace clustermon
