#include "monitor/node_info_monitor.hpp"
#include <unistd.h>
#include <string>
#include "node_report.pb.h"
#include "fastlog/fastlog.hpp"

namespace clustermon {

namespace {
constexpr char kWorkerLoggerName[] = "worker_file_logger";
}

NodeInfoMonitor::NodeInfoMonitor(std::string node_name)
    : _node_name(std::move(node_name)) {}

std::string NodeInfoMonitor::get_hostname() {
  char hostname[256];
  if (gethostname(hostname, sizeof(hostname)) == 0) {
    hostname[sizeof(hostname) - 1] = '\0';
    return std::string(hostname);
  }
  fastlog::file::get_logger(kWorkerLoggerName)->error("Failed to get hostname");
  return "unknown";
}

int64_t NodeInfoMonitor::get_cpu_capacity() {
  long cpus = sysconf(_SC_NPROCESSORS_ONLN);
  if (cpus <= 0) {
    fastlog::file::get_logger(kWorkerLoggerName)->error("Failed to get online cpu count");
    return 0;
  }
  return static_cast<int64_t>(cpus) * 1000;
}

void NodeInfoMonitor::update(clustermon::proto::NodeReport* report) {
  if (!report) {
    return;
  }

  if (_node_name.empty()) {
    _node_name = get_hostname();
  }
  _cpu_capacity = get_cpu_capacity();

  report->set_node_name(_node_name);
  report->set_cpu_capacity_millicores(_cpu_capacity);
}

}
