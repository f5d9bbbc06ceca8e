#include "log_level.hpp"

namespace clustermon {

bool parse_log_level(std::string_view name, fastlog::LogLevel* level) {
  if (name == "trace") {
    *level = fastlog::LogLevel::Trace;
  } else if (name == "debug") {
    *level = fastlog::LogLevel::Debug;
  } else if (name == "info") {
    *level = fastlog::LogLevel::Info;
  } else if (name == "warn") {
    *level = fastlog::LogLevel::Warn;
  } else if (name == "error") {
    *level = fastlog::LogLevel::Error;
  } else {
    return false;
  }
  return true;
}

}  // namespace clustermon
