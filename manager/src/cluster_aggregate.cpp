#include "cluster_aggregate.hpp"

namespace clustermon {

double cpu_percent(int64_t used, int64_t capacity) {
  if (capacity <= 0) {
    return 0;
  }
  return static_cast<double>(used) / static_cast<double>(capacity) * 100.0;
}

bool aggregate_cluster(const std::vector<ResolvedNode>& nodes,
                       ClusterAggregate* aggregate) {
  ClusterAggregate result;
  for (const auto& node : nodes) {
    result.total_cpu += node.cpu_capacity;
    result.used_cpu += node.usage.cpu_used;
  }
  if (nodes.empty() || result.total_cpu <= 0) {
    return false;
  }

  result.cpu_usage = cpu_percent(result.used_cpu, result.total_cpu);
  *aggregate = result;
  return true;
}

}  // namespace clustermon
