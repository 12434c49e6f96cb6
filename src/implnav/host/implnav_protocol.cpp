#include "implnav/host/implnav_protocol.hpp"

#include <lsp/json_utils.hpp>

namespace implnav::protocol {

void to_json(nlohmann::json& j, const CommandStateResult& r) {
  j = nlohmann::json{{"available", r.available}};
}

void from_json(const nlohmann::json& j, CommandStateResult& r) {
  j.at("available").get_to(r.available);
}

auto PresentedDefinition::FromItem(const DefinitionItem& item)
    -> PresentedDefinition {
  return PresentedDefinition{
      .location = item.location,
      .displayName = item.display_name,
      .containerName = item.container_name,
  };
}

void to_json(nlohmann::json& j, const PresentedDefinition& d) {
  j = nlohmann::json{
      {"location", d.location},
      {"displayName", d.displayName},
  };
  lsp::to_json_optional(j, "containerName", d.containerName);
}

void from_json(const nlohmann::json& j, PresentedDefinition& d) {
  j.at("location").get_to(d.location);
  j.at("displayName").get_to(d.displayName);
  lsp::from_json_optional(j, "containerName", d.containerName);
}

void to_json(nlohmann::json& j, const PresentDefinitionsParams& p) {
  j = nlohmann::json{{"title", p.title}, {"items", p.items}};
}

void from_json(const nlohmann::json& j, PresentDefinitionsParams& p) {
  j.at("title").get_to(p.title);
  j.at("items").get_to(p.items);
}

}  // namespace implnav::protocol
