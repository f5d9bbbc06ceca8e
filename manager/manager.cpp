#include <grpc/grpc.h>
#include <grpcpp/server_builder.h>

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "collector.hpp"
#include "fastlog/fastlog.hpp"
#include "manager_config.hpp"
#include "mysql_metric_store.hpp"
#include "node_registry.hpp"
#include "rpc/metrics_service.hpp"
#include "rpc/node_report_service.hpp"

namespace {
constexpr char kManagerLoggerName[] = "manager_file_logger";
}

int main(int argc, char* argv[]) {
  clustermon::ManagerConfig config;
  std::string error;
  if (!clustermon::parse_manager_args(argc, argv, &config, &error)) {
    std::cerr << error << "\n" << clustermon::manager_usage(argv[0]);
    return 1;
  }

  std::filesystem::path log_dir = "/tmp/clustermon_logs/manager";
  std::filesystem::create_directories(log_dir);
  std::string log_path = (log_dir / "manager.log").string();
  auto& log = fastlog::file::make_logger(kManagerLoggerName, log_path);
  log.set_level(config.log_level);

  log.info("Starting clustermon manager...");
  log.info("Listening on: {}", config.listen_address);

  // 信号交给专门的线程处理，之后创建的线程都继承该屏蔽字
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  // 存储打不开则不提供服务
  clustermon::MysqlMetricStore store;
  if (!store.open(config.mysql, &error)) {
    log.error("Failed to open metric store: {}", error);
    std::cerr << "[ERROR] Failed to open metric store: " << error << "\n";
    log.flush();
    return 1;
  }

  clustermon::NodeRegistry registry(config.stale_after);
  registry.start();

  clustermon::Collector collector(&registry, &store, config.collect_interval);

  clustermon::NodeReportServiceImpl report_service(&registry);
  clustermon::MetricsServiceImpl metrics_service(&store, &collector);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address,
                           grpc::InsecureServerCredentials());
  builder.RegisterService(&report_service);
  builder.RegisterService(&metrics_service);

  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    log.error("Failed to listen on {}", config.listen_address);
    std::cerr << "[ERROR] Failed to listen on " << config.listen_address << "\n";
    registry.stop();
    log.flush();
    return 1;
  }

  collector.start();
  log.info("clustermon manager listening on {}", config.listen_address);
  log.info("Collecting every {} ms, nodes stale after {} s",
           config.collect_interval.count(), config.stale_after.count());

  std::thread signal_thread([&server, &signals, &log]() {
    int sig = 0;
    sigwait(&signals, &sig);
    log.info("Received signal {}, shutting down", sig);
    server->Shutdown();
  });

  // 定期手动刷新文件日志，避免缓冲区未满时日志不落盘
  std::atomic<bool> running{true};
  std::thread flush_thread([&running]() {
    while (running) {
      std::this_thread::sleep_for(std::chrono::seconds(2));
      if (!running) break;
      auto* lg = fastlog::file::get_logger(kManagerLoggerName);
      if (lg) lg->flush();
    }
  });

  server->Wait();

  // 正在进行的采集周期完成后再关闭存储
  collector.stop();
  registry.stop();
  store.close();
  if (signal_thread.joinable()) signal_thread.join();

  running = false;
  if (flush_thread.joinable()) flush_thread.join();
  log.info("clustermon manager stopped");
  log.flush();

  return 0;
}
