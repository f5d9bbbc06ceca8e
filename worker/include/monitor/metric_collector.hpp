#pragma once

#include <memory>
#include <string>
#include <vector>

#include "monitor/monitor.hpp"
#include "node_report.pb.h"

namespace clustermon {

class MetricCollector {
 public:
  explicit MetricCollector(const std::string& node_name = "");
  ~MetricCollector();

  // 采集所有指标并填充到 NodeReport
  void collect_all(clustermon::proto::NodeReport* report);

 private:
  std::vector<std::unique_ptr<Monitor>> _monitors;
};

}  // namespace clustermon
