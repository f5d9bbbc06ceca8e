#pragma once

#include <string_view>

#include "fastlog/fastlog.hpp"

namespace clustermon {

// trace|debug|info|warn|error，区分大小写；无法识别时返回 false 且不修改 level
bool parse_log_level(std::string_view name, fastlog::LogLevel* level);

}  // namespace clustermon
