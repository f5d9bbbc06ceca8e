#include "monitor/metric_collector.hpp"

#include <chrono>
#include <memory>

#include "monitor/cpu_usage_monitor.hpp"
#include "monitor/memory_monitor.hpp"
#include "monitor/node_info_monitor.hpp"

namespace clustermon {

MetricCollector::MetricCollector(const std::string& node_name) {
  // NodeInfoMonitor 必须在 CpuUsageMonitor 之前，后者依赖容量
  _monitors.push_back(std::make_unique<NodeInfoMonitor>(node_name));
  _monitors.push_back(std::make_unique<CpuUsageMonitor>());
  _monitors.push_back(std::make_unique<MemoryMonitor>());
}

MetricCollector::~MetricCollector() {
  for (auto& monitor : _monitors) {
    monitor->stop();
  }
}

void MetricCollector::collect_all(clustermon::proto::NodeReport* report) {
  if (!report) {
    return;
  }

  auto now = std::chrono::system_clock::now();
  auto seconds = std::chrono::floor<std::chrono::seconds>(now);
  report->mutable_report_time()->set_seconds(seconds.time_since_epoch().count());
  report->mutable_report_time()->set_nanos(static_cast<int32_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now - seconds).count()));

  for (auto& monitor : _monitors) {
    monitor->update(report);
  }
}

}  // namespace clustermon
