#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include "fastlog/fastlog.hpp"
#include "log_level.hpp"
#include "rpc/usage_pusher.hpp"

namespace {
constexpr char kWorkerLoggerName[] = "worker_file_logger";
}

constexpr char kDefaultManagerAddress[] = "localhost:50051";
constexpr int kDefaultPushInterval = 10;  // 秒

void PrintUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " [--manager=ADDR] [--interval=SECONDS] [--node-name=NAME]"
               " [--log-level=LEVEL]\n"
            << "  --manager:   管理者服务器地址 (默认 " << kDefaultManagerAddress << ")\n"
            << "  --interval:  推送间隔秒数 (默认 " << kDefaultPushInterval << ")\n"
            << "  --node-name: 上报的节点名 (默认主机名)\n"
            << "  --log-level: trace|debug|info|warn|error (默认 info)\n";
}

int main(int argc, char* argv[]) {
  std::string manager_address = kDefaultManagerAddress;
  int interval_seconds = kDefaultPushInterval;
  std::string node_name;
  fastlog::LogLevel level = fastlog::LogLevel::Info;

  // 解析命令行参数
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto eq = arg.find('=');
    if (!arg.starts_with("--") || eq == std::string_view::npos) {
      PrintUsage(argv[0]);
      return 1;
    }
    std::string_view key = arg.substr(2, eq - 2);
    std::string_view value = arg.substr(eq + 1);
    if (key == "manager") {
      manager_address = value;
    } else if (key == "interval") {
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), interval_seconds);
      if (ec != std::errc() || ptr != value.data() + value.size() || interval_seconds <= 0) {
        PrintUsage(argv[0]);
        return 1;
      }
    } else if (key == "node-name") {
      node_name = value;
    } else if (key == "log-level") {
      if (!clustermon::parse_log_level(value, &level)) {
        PrintUsage(argv[0]);
        return 1;
      }
    } else {
      PrintUsage(argv[0]);
      return 1;
    }
  }

  std::filesystem::path log_dir = "/tmp/clustermon_logs/worker";
  std::filesystem::create_directories(log_dir);
  std::string log_path = (log_dir / "worker.log").string();
  auto& log = fastlog::file::make_logger(kWorkerLoggerName, log_path);
  log.set_level(level);

  log.info("Starting clustermon worker (push mode)...");
  log.info("Manager address: {}", manager_address);
  log.info("Push interval: {} seconds", interval_seconds);

  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  // 创建并启动推送器
  clustermon::UsagePusher pusher(manager_address, interval_seconds, node_name);
  pusher.start();

  // 定期刷新文件日志
  std::atomic<bool> running{true};
  std::thread flush_thread([&running]() {
    while (running) {
      std::this_thread::sleep_for(std::chrono::seconds(2));
      if (!running) break;
      auto* lg = fastlog::file::get_logger(kWorkerLoggerName);
      if (lg) lg->flush();
    }
  });

  // 主线程等待退出信号
  int sig = 0;
  sigwait(&signals, &sig);
  log.info("Received signal {}, stopping", sig);
  pusher.stop();

  running = false;
  if (flush_thread.joinable()) flush_thread.join();
  log.info("clustermon worker stopped");
  log.flush();

  return 0;
}
