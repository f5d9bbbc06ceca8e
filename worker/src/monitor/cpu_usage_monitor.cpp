#include "monitor/cpu_usage_monitor.hpp"

#include <charconv>
#include <cmath>

#include "fastlog/fastlog.hpp"
#include "util/readfile.hpp"

namespace clustermon {

namespace {
constexpr char kWorkerLoggerName[] = "worker_file_logger";
}

CpuUsageMonitor::CpuUsageMonitor(std::string stat_path)
    : _stat_path(std::move(stat_path)) {}

bool CpuUsageMonitor::parse_cpu_line(const std::vector<std::string>& fields,
                                     CpuTimes* times) {
  // 至少需要 user nice system idle
  if (fields.size() < 5 || fields[0] != "cpu") {
    return false;
  }

  uint64_t values[8] = {0};
  for (size_t i = 1; i < fields.size() && i <= 8; ++i) {
    const std::string& field = fields[i];
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), values[i - 1]);
    if (ec != std::errc() || ptr != field.data() + field.size()) {
      return false;
    }
  }

  uint64_t user = values[0], nice = values[1], system = values[2];
  uint64_t idle = values[3], io_wait = values[4], irq = values[5];
  uint64_t soft_irq = values[6], steal = values[7];

  times->busy = user + nice + system + irq + soft_irq + steal;
  times->total = times->busy + idle + io_wait;
  return true;
}

int64_t CpuUsageMonitor::used_millicores(const CpuTimes& prev,
                                         const CpuTimes& curr,
                                         int64_t capacity_millicores) {
  if (curr.total <= prev.total || curr.busy < prev.busy ||
      capacity_millicores <= 0) {
    return 0;
  }
  double busy_ratio = static_cast<double>(curr.busy - prev.busy) /
                      static_cast<double>(curr.total - prev.total);
  return static_cast<int64_t>(
      std::llround(busy_ratio * static_cast<double>(capacity_millicores)));
}

bool CpuUsageMonitor::read_cpu_times(CpuTimes* times) {
  ReadFile stat_file(_stat_path);
  if (!stat_file.is_open()) {
    return false;
  }
  std::vector<std::string> fields;
  while (stat_file.read_line(&fields)) {
    if (parse_cpu_line(fields, times)) {
      return true;
    }
    fields.clear();
  }
  return false;
}

void CpuUsageMonitor::update(clustermon::proto::NodeReport* report) {
  CpuTimes now;
  if (!read_cpu_times(&now)) {
    fastlog::file::get_logger(kWorkerLoggerName)->error("Failed to read cpu times from {}", _stat_path);
    return;
  }

  int64_t used = 0;
  if (_has_last) {
    used = used_millicores(_last, now, report->cpu_capacity_millicores());
  }
  report->set_cpu_used_millicores(used);

  _last = now;
  _has_last = true;
}

}  // namespace clustermon
