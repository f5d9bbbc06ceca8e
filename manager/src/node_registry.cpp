#include "node_registry.hpp"

#include <format>

#include "fastlog/fastlog.hpp"

namespace clustermon {

namespace {
constexpr char kManagerLoggerName[] = "manager_file_logger";
}

NodeRegistry::NodeRegistry(std::chrono::seconds stale_after)
    : _stale_after(stale_after), _running(false) {}

NodeRegistry::~NodeRegistry() { stop(); }

void NodeRegistry::start() {
  if (_running) {
    return;
  }
  _running = true;
  _thread = std::make_unique<std::thread>(&NodeRegistry::prune_for_loop, this);
}

void NodeRegistry::stop() {
  {
    std::lock_guard<std::mutex> lock(_wait_mtx);
    _running = false;
  }
  _wait_cv.notify_all();
  if (_thread && _thread->joinable()) {
    _thread->join();
  }
}

void NodeRegistry::prune_for_loop() {
  while (_running) {
    {
      std::unique_lock<std::mutex> lock(_wait_mtx);
      _wait_cv.wait_for(lock, _stale_after, [this] { return !_running; });
    }
    if (!_running) break;
    prune_stale();
  }
}

bool NodeRegistry::on_report(const clustermon::proto::NodeReport& report,
                             std::string* error) {
  return on_report(report, std::chrono::steady_clock::now(), error);
}

bool NodeRegistry::on_report(const clustermon::proto::NodeReport& report,
                             std::chrono::steady_clock::time_point received_at,
                             std::string* error) {
  if (report.node_name().empty()) {
    if (error) *error = "Missing node name";
    fastlog::file::get_logger(kManagerLoggerName)->error("Received node report with empty node name");
    return false;
  }
  if (report.cpu_used_millicores() < 0 || report.cpu_capacity_millicores() < 0 ||
      report.memory_used_bytes() < 0) {
    if (error) *error = std::format("Negative usage in report from {}", report.node_name());
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(_mtx);
    _nodes[report.node_name()] = NodeEntry{report, received_at};
    _ever_reported = true;
  }

  fastlog::file::get_logger(kManagerLoggerName)->debug("Node {}: cpu {}/{}m, memory {} bytes",
               report.node_name(), report.cpu_used_millicores(),
               report.cpu_capacity_millicores(), report.memory_used_bytes());
  return true;
}

bool NodeRegistry::list_node_usage(std::vector<NodeUsage>* usages,
                                   std::string* error) {
  auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_ever_reported) {
    if (error) *error = "no node metrics available yet";
    return false;
  }

  usages->clear();
  for (const auto& [name, entry] : _nodes) {
    if (!is_fresh(entry, now)) {
      continue;
    }
    NodeUsage usage;
    usage.node_name = name;
    usage.cpu_used = entry.report.cpu_used_millicores();
    usage.memory_used = entry.report.memory_used_bytes();
    usages->push_back(std::move(usage));
  }
  return true;
}

bool NodeRegistry::get_node_capacity(const std::string& node_name,
                                     int64_t* cpu_capacity,
                                     std::string* error) {
  auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _nodes.find(node_name);
  if (it == _nodes.end()) {
    if (error) *error = std::format("node {} not found", node_name);
    return false;
  }
  if (!is_fresh(it->second, now)) {
    if (error) *error = std::format("node {} has not reported recently", node_name);
    return false;
  }
  int64_t capacity = it->second.report.cpu_capacity_millicores();
  if (capacity <= 0) {
    if (error) *error = std::format("node {} reported no cpu capacity", node_name);
    return false;
  }
  *cpu_capacity = capacity;
  return true;
}

size_t NodeRegistry::prune_stale() {
  auto now = std::chrono::steady_clock::now();
  size_t removed = 0;
  std::lock_guard<std::mutex> lock(_mtx);
  for (auto it = _nodes.begin(); it != _nodes.end();) {
    if (!is_fresh(it->second, now)) {
      fastlog::file::get_logger(kManagerLoggerName)->info("Removing stale node: {}", it->first);
      it = _nodes.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

size_t NodeRegistry::node_count() {
  std::lock_guard<std::mutex> lock(_mtx);
  return _nodes.size();
}

bool NodeRegistry::is_fresh(const NodeEntry& entry,
                            std::chrono::steady_clock::time_point now) const {
  return now - entry.received_at <= _stale_after;
}

}  // namespace clustermon
