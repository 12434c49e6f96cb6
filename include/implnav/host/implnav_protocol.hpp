#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <lsp/basic.hpp>
#include <nlohmann/json.hpp>

#include "implnav/find_usages/definition_item.hpp"

// Messages implnav exchanges with its editor client on top of the base
// protocol
namespace implnav::protocol {

constexpr std::string_view kGoToImplementationCommand =
    "implnav.goToImplementation";
constexpr std::string_view kCommandStateMethod = "implnav/commandState";
constexpr std::string_view kPresentDefinitionsMethod =
    "implnav/presentDefinitions";

// implnav/commandState takes a TextDocumentIdentifier
struct CommandStateResult {
  bool available;
};

void to_json(nlohmann::json& j, const CommandStateResult& r);
void from_json(const nlohmann::json& j, CommandStateResult& r);

struct PresentedDefinition {
  lsp::Location location;
  std::string displayName;
  std::optional<std::string> containerName;

  static auto FromItem(const DefinitionItem& item) -> PresentedDefinition;
};

void to_json(nlohmann::json& j, const PresentedDefinition& d);
void from_json(const nlohmann::json& j, PresentedDefinition& d);

// Sent when a search found zero or several definitions. Items are in the
// order the search reported them.
struct PresentDefinitionsParams {
  std::string title;
  std::vector<PresentedDefinition> items;
};

void to_json(nlohmann::json& j, const PresentDefinitionsParams& p);
void from_json(const nlohmann::json& j, PresentDefinitionsParams& p);

}  // namespace implnav::protocol
