#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace implnav {

// Contents of a .implnav configuration file
//
//   GoToImplementation:
//     Streaming: true
//     Languages:
//       systemverilog:
//         Streaming: false
class ImplnavConfigFile {
 public:
  static constexpr bool kDefaultStreaming = true;

  explicit ImplnavConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger = nullptr)
      -> ImplnavConfigFile;

  // Returns std::nullopt if the file doesn't exist or is not valid YAML
  static auto LoadFromFile(
      const std::filesystem::path& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<ImplnavConfigFile>;

  [[nodiscard]] auto GetDefaultStreaming() const -> bool {
    return default_streaming_;
  }

  [[nodiscard]] auto GetLanguageStreaming(const std::string& language_id) const
      -> std::optional<bool>;

  // Per-language override if present, otherwise the global default
  [[nodiscard]] auto IsStreamingGoToImplementationEnabled(
      const std::string& language_id) const -> bool;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  bool default_streaming_ = kDefaultStreaming;
  std::unordered_map<std::string, bool> language_streaming_;
};

}  // namespace implnav
