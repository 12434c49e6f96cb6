#include "implnav/core/implnav_config_file.hpp"

#include <yaml-cpp/yaml.h>

namespace implnav {

ImplnavConfigFile::ImplnavConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto ImplnavConfigFile::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> ImplnavConfigFile {
  return ImplnavConfigFile(std::move(logger));
}

auto ImplnavConfigFile::LoadFromFile(
    const std::filesystem::path& config_path,
    std::shared_ptr<spdlog::logger> logger)
    -> std::optional<ImplnavConfigFile> {
  ImplnavConfigFile config(logger);

  if (!std::filesystem::exists(config_path)) {
    config.logger_->debug(
        "No .implnav configuration file found at {}", config_path.string());
    return std::nullopt;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.string());

    const auto& section = yaml["GoToImplementation"];
    if (!section) {
      return config;
    }

    if (section["Streaming"]) {
      config.default_streaming_ = section["Streaming"].as<bool>();
      config.logger_->debug(
          "Loaded GoToImplementation.Streaming: {}", config.default_streaming_);
    }

    if (section["Languages"]) {
      for (const auto& entry : section["Languages"]) {
        auto language_id = entry.first.as<std::string>();
        const auto& settings = entry.second;
        if (settings.IsMap() && settings["Streaming"]) {
          auto enabled = settings["Streaming"].as<bool>();
          config.language_streaming_[language_id] = enabled;
          config.logger_->debug(
              "Loaded GoToImplementation.Languages.{}.Streaming: {}",
              language_id, enabled);
        }
      }
    }
  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .implnav file {}: {}", config_path.string(), e.what());
    return std::nullopt;
  }

  return config;
}

auto ImplnavConfigFile::GetLanguageStreaming(
    const std::string& language_id) const -> std::optional<bool> {
  auto it = language_streaming_.find(language_id);
  if (it == language_streaming_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ImplnavConfigFile::IsStreamingGoToImplementationEnabled(
    const std::string& language_id) const -> bool {
  return GetLanguageStreaming(language_id).value_or(default_streaming_);
}

}  // namespace implnav
