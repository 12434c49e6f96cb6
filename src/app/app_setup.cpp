#include "app/app_setup.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kPipePrefix = "--pipe=";
constexpr std::string_view kLogPattern = "[%n][%L] %v";
constexpr auto kDefaultLogLevel = spdlog::level::info;

auto GetLogLevelFromEnv() -> spdlog::level::level_enum {
  const char* env_level = std::getenv("SPDLOG_LEVEL");
  if (env_level == nullptr) {
    return kDefaultLogLevel;
  }
  // from_str maps unknown names to off, which would hide everything
  auto level = spdlog::level::from_str(env_level);
  if (level == spdlog::level::off && std::string_view(env_level) != "off") {
    return kDefaultLogLevel;
  }
  return level;
}

}  // namespace

auto ParsePipeName(const std::vector<std::string>& args)
    -> std::optional<std::string> {
  auto it = std::ranges::find_if(args.begin() + std::min<size_t>(1, args.size()),
                                 args.end(), [](const std::string& arg) {
                                   return arg.starts_with(kPipePrefix);
                                 });
  if (it == args.end() || it->size() == kPipePrefix.size()) {
    return std::nullopt;
  }
  return it->substr(kPipePrefix.size());
}

auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_level = GetLogLevelFromEnv();
  spdlog::set_level(user_level);

  const auto protocol_level = std::max(user_level, spdlog::level::info);
  const std::array<std::pair<std::string, spdlog::level::level_enum>, 3>
      configs = {{
          {"transport", protocol_level},
          {"jsonrpc", protocol_level},
          {"implnav", user_level},
      }};

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;
  for (const auto& [name, level] : configs) {
    // stdout may carry the protocol when no pipe is used; log to stderr
    auto logger = spdlog::stderr_color_mt(name);
    logger->set_pattern(std::string(kLogPattern));
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    loggers[name] = std::move(logger);
  }
  return loggers;
}

}  // namespace app
