#pragma once

#include <memory>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

#include <lsp/basic.hpp>

#include "implnav/core/document.hpp"
#include "implnav/find_usages/definition_item.hpp"
#include "implnav/find_usages/implementation_services.hpp"

namespace implnav::features {

// One "go to implementation" invocation
struct LookupRequest {
  Document document;
  lsp::Position position;
  std::stop_token cancellation_token;
};

// Lookup strategies. The two service shapes have different contracts (the
// synchronous one may navigate by itself), so they are kept apart instead
// of hidden behind a common interface.
struct StreamingStrategy {
  std::shared_ptr<StreamingImplementationService> service;
};

struct SynchronousStrategy {
  std::shared_ptr<SynchronousImplementationService> service;
};

struct NoStrategy {};

using LookupStrategy =
    std::variant<NoStrategy, StreamingStrategy, SynchronousStrategy>;

// Lookup outcomes
struct MessageOutcome {
  std::string message;
};

struct DefinitionsOutcome {
  std::string search_title;
  std::vector<DefinitionItem> definitions;
};

// The synchronous service finished the request itself
struct HandledOutcome {};

using LookupOutcome =
    std::variant<MessageOutcome, DefinitionsOutcome, HandledOutcome>;

}  // namespace implnav::features
