#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "fastlog/fastlog.hpp"
#include "log_level.hpp"
#include "mysql_metric_store.hpp"

namespace clustermon {

constexpr char kDefaultListenAddress[] = "0.0.0.0:50051";
constexpr char kDefaultMysqlHost[] = "127.0.0.1";
constexpr unsigned int kDefaultMysqlPort = 3306;
constexpr char kDefaultMysqlUser[] = "monitor";
constexpr char kDefaultMysqlPass[] = "monitor123";
constexpr char kDefaultMysqlDb[] = "clustermon_db";
constexpr int kDefaultCollectIntervalMs = 1000;
constexpr int kDefaultStaleSeconds = 30;
constexpr char kMysqlPasswordEnv[] = "CLUSTERMON_MYSQL_PASSWORD";

struct ManagerConfig {
  std::string listen_address = kDefaultListenAddress;
  MysqlOptions mysql{kDefaultMysqlHost, kDefaultMysqlPort, kDefaultMysqlUser,
                     kDefaultMysqlPass, kDefaultMysqlDb};
  std::chrono::milliseconds collect_interval{kDefaultCollectIntervalMs};
  std::chrono::seconds stale_after{kDefaultStaleSeconds};
  fastlog::LogLevel log_level = fastlog::LogLevel::Info;
};

// 解析 --key=value 形式的命令行参数，密码也可由环境变量提供（命令行优先）。
// 遇到未知参数或非法取值返回 false。
bool parse_manager_args(int argc, char* argv[], ManagerConfig* config,
                        std::string* error);

std::string manager_usage(const char* program);

}  // namespace clustermon
