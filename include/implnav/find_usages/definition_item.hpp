#pragma once

#include <optional>
#include <string>

#include <lsp/basic.hpp>

namespace implnav {

// One implementation site reported by a search. Two items are the same
// definition when they point at the same location; display metadata does
// not take part in identity.
struct DefinitionItem {
  lsp::Location location;
  std::string display_name;
  std::optional<std::string> container_name;

  friend auto operator==(const DefinitionItem& lhs, const DefinitionItem& rhs)
      -> bool {
    return lhs.location == rhs.location;
  }
};

}  // namespace implnav
