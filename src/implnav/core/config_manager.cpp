#include "implnav/core/config_manager.hpp"

namespace implnav {

ConfigManager::ConfigManager(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      config_(ImplnavConfigFile::CreateDefault(logger_)) {
}

auto ConfigManager::LoadFromWorkspace(
    const std::filesystem::path& workspace_root) -> bool {
  {
    std::lock_guard lock(mutex_);
    workspace_root_ = workspace_root;
  }
  logger_->debug(
      "ConfigManager loading config from workspace: {}",
      workspace_root.string());
  return Load();
}

auto ConfigManager::HandleConfigFileChange() -> bool {
  logger_->info("ConfigManager reloading configuration");
  return Load();
}

auto ConfigManager::HasConfigFile() const -> bool {
  std::lock_guard lock(mutex_);
  return has_config_file_;
}

auto ConfigManager::IsStreamingGoToImplementationEnabled(
    const std::string& language_id) const -> bool {
  std::lock_guard lock(mutex_);
  return config_.IsStreamingGoToImplementationEnabled(language_id);
}

auto ConfigManager::Load() -> bool {
  std::filesystem::path config_path;
  {
    std::lock_guard lock(mutex_);
    if (workspace_root_.empty()) {
      return false;
    }
    config_path = workspace_root_ / kConfigFileName;
  }

  auto loaded = ImplnavConfigFile::LoadFromFile(config_path, logger_);

  std::lock_guard lock(mutex_);
  has_config_file_ = loaded.has_value();
  config_ = loaded ? std::move(*loaded)
                   : ImplnavConfigFile::CreateDefault(logger_);
  return has_config_file_;
}

}  // namespace implnav
