#include "collector.hpp"

#include <vector>

#include "fastlog/fastlog.hpp"

namespace clustermon {

namespace {
constexpr char kManagerLoggerName[] = "manager_file_logger";
}

Collector::Collector(NodeMetricsProvider* provider, MetricStore* store,
                     std::chrono::milliseconds interval)
    : _provider(provider),
      _store(store),
      _interval(interval),
      _running(false) {}

Collector::~Collector() { stop(); }

void Collector::start() {
  if (_running) {
    return;
  }
  _running = true;
  _thread = std::make_unique<std::thread>(&Collector::collect_for_loop, this);
  fastlog::file::get_logger(kManagerLoggerName)->info("Collector started, interval {} ms", _interval.count());
}

void Collector::stop() {
  {
    std::lock_guard<std::mutex> lock(_wait_mtx);
    if (!_running && !_thread) {
      return;
    }
    _running = false;
  }
  _wait_cv.notify_all();
  if (_thread && _thread->joinable()) {
    _thread->join();
  }
  _thread.reset();
  fastlog::file::get_logger(kManagerLoggerName)->info("Collector stopped");
}

void Collector::collect_for_loop() {
  auto next_tick = std::chrono::steady_clock::now() + _interval;
  while (_running) {
    {
      std::unique_lock<std::mutex> lock(_wait_mtx);
      if (_wait_cv.wait_until(lock, next_tick, [this] { return !_running; })) {
        break;
      }
    }

    run_cycle();

    // 固定节拍；本周期超时则从当前时间重新计时
    next_tick += _interval;
    auto now = std::chrono::steady_clock::now();
    if (next_tick < now) {
      next_tick = now + _interval;
    }
  }
}

CycleReport Collector::run_cycle() {
  CycleReport report;
  auto* log = fastlog::file::get_logger(kManagerLoggerName);

  // 1. 获取节点用量列表，失败则跳过整个周期，下一个节拍即重试
  std::vector<NodeUsage> usages;
  std::string error;
  if (!_provider->list_node_usage(&usages, &error)) {
    if (log) log->warn("Error collecting metrics: {}", error);
    report.skipped = true;
    report.last_error = error;
    record(report);
    return report;
  }
  report.listed_nodes = static_cast<int>(usages.size());

  // 2. 逐个获取节点容量，单个节点失败只跳过该节点
  std::vector<ResolvedNode> nodes;
  nodes.reserve(usages.size());
  for (auto& usage : usages) {
    int64_t capacity = 0;
    if (!_provider->get_node_capacity(usage.node_name, &capacity, &error)) {
      if (log) log->warn("Error getting node info for {}: {}", usage.node_name, error);
      ++report.skipped_nodes;
      report.last_error = error;
      continue;
    }
    if (capacity <= 0) {
      if (log) log->warn("Node {} reported capacity {}, skipped", usage.node_name, capacity);
      ++report.skipped_nodes;
      continue;
    }
    nodes.push_back(ResolvedNode{std::move(usage), capacity});
  }
  report.resolved_nodes = static_cast<int>(nodes.size());

  // 3. 集群汇总；没有可用节点时本周期不写入
  if (!aggregate_cluster(nodes, &report.aggregate)) {
    if (log) log->debug("No nodes resolved in this cycle");
    record(report);
    return report;
  }

  // 4. 每个节点写一行，写失败互不影响
  for (const auto& node : nodes) {
    MetricSample sample;
    sample.timestamp = std::chrono::system_clock::now();
    sample.node_name = node.usage.node_name;
    sample.cpu_usage = cpu_percent(node.usage.cpu_used, node.cpu_capacity);
    sample.memory_usage = node.usage.memory_used;
    sample.is_benchmark = false;
    sample.cluster_cpu_usage = report.aggregate.cpu_usage;
    sample.cluster_total_cpu = report.aggregate.total_cpu;

    if (!_store->append(sample, &error)) {
      if (log) log->error("Error inserting metrics for {}: {}", sample.node_name, error);
      ++report.write_failures;
      report.last_error = error;
      continue;
    }
    ++report.rows_written;
  }

  if (log) log->debug("Cycle done: {} nodes, cluster cpu {}% of {}m, {} rows, {} failures",
             report.resolved_nodes, report.aggregate.cpu_usage,
             report.aggregate.total_cpu, report.rows_written,
             report.write_failures);
  record(report);
  return report;
}

CollectorStats Collector::stats() {
  std::lock_guard<std::mutex> lock(_stats_mtx);
  return _stats;
}

void Collector::record(const CycleReport& report) {
  std::lock_guard<std::mutex> lock(_stats_mtx);
  ++_stats.cycles_run;
  if (report.skipped) {
    ++_stats.cycles_skipped;
  }
  _stats.nodes_skipped += report.skipped_nodes;
  _stats.rows_written += report.rows_written;
  _stats.write_failures += report.write_failures;
  _stats.last_cycle_nodes = report.resolved_nodes;
  if (!report.last_error.empty()) {
    _stats.last_error = report.last_error;
  }
  _stats.last_cycle_time = std::chrono::system_clock::now();
}

}  // namespace clustermon
