#include "implnav/features/go_to_implementation/result_router.hpp"

namespace implnav::features {

auto RouteOutcome(const LookupOutcome& outcome)
    -> std::optional<OutcomeAction> {
  if (const auto* message = std::get_if<MessageOutcome>(&outcome)) {
    return ShowMessageAction{.message = message->message};
  }

  if (const auto* found = std::get_if<DefinitionsOutcome>(&outcome)) {
    if (found->definitions.size() == 1) {
      return NavigateAction{.definition = found->definitions.front()};
    }
    return PresentAction{
        .title = found->search_title,
        .definitions = found->definitions,
    };
  }

  return std::nullopt;
}

}  // namespace implnav::features
