#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "implnav/core/implnav_config_file.hpp"

namespace implnav {

// Owns the active configuration. Reads happen on command threads while
// reloads come from the protocol thread, so the config is mutex-guarded.
class ConfigManager {
 public:
  static constexpr std::string_view kConfigFileName = ".implnav";

  explicit ConfigManager(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Load the config file from the workspace root
  // Returns true if a config was found and loaded
  auto LoadFromWorkspace(const std::filesystem::path& workspace_root) -> bool;

  // Reload after the config file changed or was deleted
  // Returns true if a config file was loaded; defaults apply otherwise
  auto HandleConfigFileChange() -> bool;

  [[nodiscard]] auto HasConfigFile() const -> bool;

  // Read fresh on every request so edits apply to the next invocation
  [[nodiscard]] auto IsStreamingGoToImplementationEnabled(
      const std::string& language_id) const -> bool;

 private:
  auto Load() -> bool;

  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  std::filesystem::path workspace_root_;
  ImplnavConfigFile config_;
  bool has_config_file_ = false;
};

}  // namespace implnav
