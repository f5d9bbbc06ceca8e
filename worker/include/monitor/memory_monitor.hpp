#pragma once

#include "monitor/monitor.hpp"
#include "node_report.pb.h"
#include <cstdint>
#include <string>

namespace clustermon {
// 读取 /proc/meminfo，已用内存 = MemTotal - MemAvailable
class MemoryMonitor : public Monitor {
public:
  explicit MemoryMonitor(std::string meminfo_path = "/proc/meminfo");
  void update(clustermon::proto::NodeReport *report) override;
  void stop() override{}

private:
// 内部结构体，用于存储内存信息（字节）
  struct mem_info {
    int64_t total = 0;
    int64_t free = 0;
    int64_t avail = 0;
  };

  bool read_mem_info(mem_info *info);

  std::string _meminfo_path;
};
} // namespace clustermon
