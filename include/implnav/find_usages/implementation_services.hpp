#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include <asio/awaitable.hpp>
#include <lsp/basic.hpp>

#include "implnav/core/document.hpp"
#include "implnav/find_usages/find_usages_context.hpp"

namespace implnav {

struct SynchronousLookupResult {
  bool handled = false;
  std::optional<std::string> message;
};

// One-shot lookup. Blocks until done and may navigate on its own; the
// caller only learns whether it handled the request and an optional
// message to show.
class SynchronousImplementationService {
 public:
  SynchronousImplementationService() = default;
  SynchronousImplementationService(const SynchronousImplementationService&) =
      delete;
  SynchronousImplementationService(SynchronousImplementationService&&) =
      delete;
  auto operator=(const SynchronousImplementationService&)
      -> SynchronousImplementationService& = delete;
  auto operator=(SynchronousImplementationService&&)
      -> SynchronousImplementationService& = delete;
  virtual ~SynchronousImplementationService() = default;

  virtual auto TryGoToImplementation(
      const Document& document, lsp::Position position,
      std::stop_token cancellation_token) -> SynchronousLookupResult = 0;
};

// Incremental lookup. Reports definitions into the context as they are
// found and completes when every source is exhausted. Must observe the
// context's cancellation token and asio cancellation of the coroutine.
class StreamingImplementationService {
 public:
  StreamingImplementationService() = default;
  StreamingImplementationService(const StreamingImplementationService&) =
      delete;
  StreamingImplementationService(StreamingImplementationService&&) = delete;
  auto operator=(const StreamingImplementationService&)
      -> StreamingImplementationService& = delete;
  auto operator=(StreamingImplementationService&&)
      -> StreamingImplementationService& = delete;
  virtual ~StreamingImplementationService() = default;

  virtual auto FindImplementations(
      Document document, lsp::Position position,
      std::shared_ptr<FindUsagesContext> context) -> asio::awaitable<void> = 0;
};

}  // namespace implnav
