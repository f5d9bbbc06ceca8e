#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <string>
#include <string_view>

#include "rpc/metrics_client.hpp"

constexpr char kDefaultManagerAddress[] = "localhost:50051";

void PrintUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " [--manager=ADDR] <get|benchmark|reset|stats>\n"
            << "  get        print the sample history as a JSON array, newest first\n"
            << "  benchmark  copy the latest collected sample as a benchmark sample\n"
            << "  reset      delete all samples and restart the id sequence\n"
            << "  stats      print collector statistics\n"
            << "  --manager  manager address (default " << kDefaultManagerAddress
            << ")\n";
}

int main(int argc, char* argv[]) {
  std::string manager_address = kDefaultManagerAddress;
  std::string command;

  // 解析命令行参数
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg.starts_with("--manager=")) {
      manager_address = arg.substr(std::string_view("--manager=").size());
    } else if (command.empty() && !arg.starts_with("--")) {
      command = arg;
    } else {
      PrintUsage(argv[0]);
      return 2;
    }
  }
  if (command.empty()) {
    PrintUsage(argv[0]);
    return 2;
  }

  clustermon::MetricsClient client(manager_address);
  std::string error;

  if (command == "get") {
    clustermon::proto::GetMetricsResponse response;
    std::string json;
    if (!client.get_metrics(&response, &error) ||
        !clustermon::samples_to_json(response, &json, &error)) {
      std::cout << clustermon::error_to_json(error) << "\n";
      return 1;
    }
    std::cout << json << "\n";
  } else if (command == "benchmark") {
    if (!client.mark_benchmark(&error)) {
      std::cout << clustermon::error_to_json(error) << "\n";
      return 1;
    }
  } else if (command == "reset") {
    if (!client.reset(&error)) {
      std::cout << clustermon::error_to_json(error) << "\n";
      return 1;
    }
  } else if (command == "stats") {
    clustermon::proto::CollectorStats stats;
    if (!client.get_collector_stats(&stats, &error)) {
      std::cout << clustermon::error_to_json(error) << "\n";
      return 1;
    }
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    options.always_print_primitive_fields = true;
    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(stats, &json, options);
    if (!status.ok()) {
      std::cout << clustermon::error_to_json(std::string(status.message())) << "\n";
      return 1;
    }
    std::cout << json << "\n";
  } else {
    PrintUsage(argv[0]);
    return 2;
  }

  return 0;
}
