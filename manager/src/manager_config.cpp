#include "manager_config.hpp"

#include <charconv>
#include <cstdlib>
#include <format>

namespace clustermon {

namespace {

bool parse_int(std::string_view text, long long* value) {
  if (text.empty()) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), *value);
  return ec == std::errc() && ptr == text.data() + text.size();
}

}  // namespace

bool parse_manager_args(int argc, char* argv[], ManagerConfig* config,
                        std::string* error) {
  if (const char* password = std::getenv(kMysqlPasswordEnv)) {
    config->mysql.password = password;
  }

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto eq = arg.find('=');
    if (arg.substr(0, 2) != "--" || eq == std::string_view::npos) {
      if (error) *error = std::format("invalid argument: {}", arg);
      return false;
    }
    std::string_view key = arg.substr(2, eq - 2);
    std::string_view value = arg.substr(eq + 1);
    long long number = 0;

    if (key == "listen") {
      config->listen_address = value;
    } else if (key == "mysql-host") {
      config->mysql.host = value;
    } else if (key == "mysql-port") {
      if (!parse_int(value, &number) || number <= 0 || number > 65535) {
        if (error) *error = std::format("invalid mysql port: {}", value);
        return false;
      }
      config->mysql.port = static_cast<unsigned int>(number);
    } else if (key == "mysql-user") {
      config->mysql.user = value;
    } else if (key == "mysql-password") {
      config->mysql.password = value;
    } else if (key == "mysql-db") {
      config->mysql.database = value;
    } else if (key == "interval-ms") {
      if (!parse_int(value, &number) || number <= 0) {
        if (error) *error = std::format("invalid collect interval: {}", value);
        return false;
      }
      config->collect_interval = std::chrono::milliseconds(number);
    } else if (key == "stale-seconds") {
      if (!parse_int(value, &number) || number <= 0) {
        if (error) *error = std::format("invalid stale window: {}", value);
        return false;
      }
      config->stale_after = std::chrono::seconds(number);
    } else if (key == "log-level") {
      if (!parse_log_level(value, &config->log_level)) {
        if (error) *error = std::format("invalid log level: {}", value);
        return false;
      }
    } else {
      if (error) *error = std::format("unknown option: --{}", key);
      return false;
    }
  }

  if (config->listen_address.empty()) {
    if (error) *error = "listen address must not be empty";
    return false;
  }
  return true;
}

std::string manager_usage(const char* program) {
  return std::format(
      "Usage: {} [--listen=ADDR] [--mysql-host=HOST] [--mysql-port=PORT]\n"
      "          [--mysql-user=USER] [--mysql-password=PASS] [--mysql-db=DB]\n"
      "          [--interval-ms=N] [--stale-seconds=N] [--log-level=LEVEL]\n"
      "  defaults: listen {}, mysql {}:{}/{}, interval {} ms, stale {} s\n"
      "  the mysql password may also be set with {}\n",
      program, kDefaultListenAddress, kDefaultMysqlHost, kDefaultMysqlPort,
      kDefaultMysqlDb, kDefaultCollectIntervalMs, kDefaultStaleSeconds,
      kMysqlPasswordEnv);
}

}  // namespace clustermon
