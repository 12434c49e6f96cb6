#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lsp {

// Optional LSP properties are omitted on the wire instead of sent as null.
template <typename T>
void from_json_optional(
    const nlohmann::json& j, const std::string& key, std::optional<T>& value) {
  if (!j.contains(key) || j.at(key).is_null()) {
    value = std::nullopt;
    return;
  }
  value = j.at(key).get<T>();
}

template <typename T>
void to_json_optional(
    nlohmann::json& j, const std::string& key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

}  // namespace lsp
