#include "monitor/memory_monitor.hpp"

#include <cstdlib>
#include <vector>

#include "fastlog/fastlog.hpp"
#include "util/readfile.hpp"

namespace clustermon {

namespace {
constexpr char kWorkerLoggerName[] = "worker_file_logger";
}

MemoryMonitor::MemoryMonitor(std::string meminfo_path)
    : _meminfo_path(std::move(meminfo_path)) {}

bool MemoryMonitor::read_mem_info(mem_info *info) {
  ReadFile meminfo(_meminfo_path);
  if (!meminfo.is_open()) {
    return false;
  }

  bool has_total = false, has_avail = false;
  std::vector<std::string> fields;
  while (meminfo.read_line(&fields)) {
    // 形如 "MemTotal:  16316412 kB"
    if (fields.size() >= 2) {
      int64_t value = std::strtoll(fields[1].c_str(), nullptr, 10);
      if (fields.size() >= 3 && fields[2] == "kB") {
        value *= 1024;
      }
      if (fields[0] == "MemTotal:") {
        info->total = value;
        has_total = true;
      } else if (fields[0] == "MemFree:") {
        info->free = value;
      } else if (fields[0] == "MemAvailable:") {
        info->avail = value;
        has_avail = true;
      }
    }
    fields.clear();
  }

  // 旧内核没有 MemAvailable
  if (!has_avail) {
    info->avail = info->free;
  }
  return has_total;
}

void MemoryMonitor::update(clustermon::proto::NodeReport *report) {
  mem_info info;
  if (!read_mem_info(&info)) {
    fastlog::file::get_logger(kWorkerLoggerName)->error("Failed to read memory info from {}", _meminfo_path);
    return;
  }

  int64_t used = info.total - info.avail;
  report->set_memory_total_bytes(info.total);
  report->set_memory_used_bytes(used < 0 ? 0 : used);
}

} // namespace clustermon
