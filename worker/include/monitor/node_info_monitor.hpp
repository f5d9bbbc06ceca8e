#pragma once

#include "monitor/monitor.hpp"
#include <cstdint>
#include <string>

namespace clustermon {

class NodeInfoMonitor : public Monitor {
public:
  // node_name 为空时使用主机名
  explicit NodeInfoMonitor(std::string node_name = "");
  ~NodeInfoMonitor() override = default;

  void update(clustermon::proto::NodeReport *report) override;
  void stop() override {}

private:
  /**
   * 获取主机名
   * 使用 gethostname() 系统调用
   * @return 主机名字符串
   */
  std::string get_hostname();

  /**
   * 获取 CPU 容量
   * 在线 CPU 数 * 1000
   * @return millicore
   */
  int64_t get_cpu_capacity();

  std::string _node_name;       // 节点名（主机名通常不变，只获取一次）
  int64_t _cpu_capacity = 0;    // 每次上报重新获取，CPU 可能热插拔
};

} // namespace clustermon
