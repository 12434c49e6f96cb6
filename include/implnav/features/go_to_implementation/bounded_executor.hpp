#pragma once

#include <expected>
#include <memory>
#include <string_view>

#include <asio/any_io_executor.hpp>
#include <spdlog/spdlog.h>

#include "implnav/commanding/wait_context.hpp"
#include "implnav/error/error.hpp"
#include "implnav/features/go_to_implementation/lookup_types.hpp"

namespace implnav::features {

// Runs one lookup strategy inside a cancellable wait scope and blocks the
// calling thread until it completes or the user cancels.
class BoundedExecutor {
 public:
  static constexpr std::string_view kWaitDescription =
      "Locating implementations...";

  // Streaming searches are spawned on `search_executor`, which must be run
  // by threads other than the one calling Execute.
  explicit BoundedExecutor(
      asio::any_io_executor search_executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Fails with kCancelled when the user cancelled the wait and with
  // kSearchFailed when the search threw. Neither outcome may be routed.
  auto Execute(
      const LookupStrategy& strategy, const LookupRequest& request,
      WaitContext& wait_context) -> std::expected<LookupOutcome, ImplnavError>;

 private:
  auto RunSynchronous(
      SynchronousImplementationService& service, const LookupRequest& request)
      -> std::expected<LookupOutcome, ImplnavError>;

  auto RunStreaming(
      std::shared_ptr<StreamingImplementationService> service,
      const LookupRequest& request)
      -> std::expected<LookupOutcome, ImplnavError>;

  asio::any_io_executor search_executor_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace implnav::features
