#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "implnav/features/go_to_implementation/lookup_types.hpp"

namespace implnav::features {

struct ShowMessageAction {
  std::string message;
};

struct NavigateAction {
  DefinitionItem definition;
};

struct PresentAction {
  std::string title;
  std::vector<DefinitionItem> definitions;
};

using OutcomeAction =
    std::variant<ShowMessageAction, NavigateAction, PresentAction>;

// Decides what the user sees for a finished lookup:
//   message                        -> ShowMessage
//   exactly one definition         -> Navigate straight to it
//   zero or several definitions    -> Present, the presenter decides how
//   handled by the synchronous service -> nothing
[[nodiscard]] auto RouteOutcome(const LookupOutcome& outcome)
    -> std::optional<OutcomeAction>;

}  // namespace implnav::features
