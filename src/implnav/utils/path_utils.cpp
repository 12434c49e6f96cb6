#include "implnav/utils/path_utils.hpp"

#include <charconv>

#include <fmt/format.h>

#include "implnav/core/config_manager.hpp"

namespace implnav::utils {

namespace {

auto PercentDecode(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());

  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      unsigned int value = 0;
      const auto* first = text.data() + i + 1;
      auto [ptr, ec] = std::from_chars(first, first + 2, value, 16);
      if (ec == std::errc() && ptr == first + 2) {
        result += static_cast<char>(value);
        i += 2;
        continue;
      }
    }
    result += text[i];
  }
  return result;
}

}  // namespace

auto IsConfigFile(const std::filesystem::path& path) -> bool {
  return path.filename() == ConfigManager::kConfigFileName;
}

auto UriToPath(std::string_view uri) -> std::filesystem::path {
  if (!uri.starts_with("file://")) {
    return {uri};
  }

  std::string path = PercentDecode(uri.substr(7));

  // file:///C:/path -> C:/path
  if (path.size() >= 3 && path[0] == '/' && path[2] == ':') {
    path = path.substr(1);
  }
  return {path};
}

auto PathToUri(const std::filesystem::path& path) -> std::string {
  std::string result = "file://";
  const auto text = path.generic_string();

  if (text.size() >= 2 && text[1] == ':') {
    result += '/';
  }

  for (char c : text) {
    auto byte = static_cast<unsigned char>(c);
    if (c == ' ' || c == '%' || c == '#' || c == '?' || byte > 127 ||
        byte < 32) {
      result += fmt::format("%{:02X}", byte);
    } else {
      result += c;
    }
  }
  return result;
}

}  // namespace implnav::utils
