#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace app {

/// Name of the pipe given as --pipe=<name>, in any argument position
auto ParsePipeName(const std::vector<std::string>& args)
    -> std::optional<std::string>;

/// Creates the "transport", "jsonrpc" and "implnav" loggers. The implnav
/// level comes from SPDLOG_LEVEL; protocol loggers never go below info.
auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
