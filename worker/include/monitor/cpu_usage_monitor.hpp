#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "monitor/monitor.hpp"
#include "node_report.pb.h"

namespace clustermon {

// 从 /proc/stat 的汇总 cpu 行计算 CPU 用量（millicore）。
// 需要上报消息中已填好 cpu_capacity_millicores，首次采样没有差值，上报 0。
class CpuUsageMonitor : public Monitor {
 public:
  struct CpuTimes {
    uint64_t busy = 0;
    uint64_t total = 0;
  };

  explicit CpuUsageMonitor(std::string stat_path = "/proc/stat");
  void update(clustermon::proto::NodeReport* report) override;
  void stop() override {}

  // 解析 "cpu user nice system idle iowait irq softirq steal ..." 一行
  static bool parse_cpu_line(const std::vector<std::string>& fields,
                             CpuTimes* times);

  // 两次采样之间的忙碌比例乘以容量
  static int64_t used_millicores(const CpuTimes& prev, const CpuTimes& curr,
                                 int64_t capacity_millicores);

 private:
  bool read_cpu_times(CpuTimes* times);

  std::string _stat_path;
  CpuTimes _last;
  bool _has_last = false;
};

}  // namespace clustermon
