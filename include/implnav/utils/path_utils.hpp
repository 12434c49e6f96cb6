#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace implnav::utils {

[[nodiscard]] auto IsConfigFile(const std::filesystem::path& path) -> bool;

// file:// URIs only; anything else is returned as a plain path
[[nodiscard]] auto UriToPath(std::string_view uri) -> std::filesystem::path;
[[nodiscard]] auto PathToUri(const std::filesystem::path& path) -> std::string;

}  // namespace implnav::utils
