#include "implnav/features/go_to_implementation/bounded_executor.hpp"

#include <exception>
#include <string>

#include "implnav/find_usages/find_usages_context.hpp"
#include "implnav/utils/await_or_cancel.hpp"

namespace implnav::features {

BoundedExecutor::BoundedExecutor(
    asio::any_io_executor search_executor,
    std::shared_ptr<spdlog::logger> logger)
    : search_executor_(std::move(search_executor)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto BoundedExecutor::Execute(
    const LookupStrategy& strategy, const LookupRequest& request,
    WaitContext& wait_context) -> std::expected<LookupOutcome, ImplnavError> {
  auto scope = wait_context.AddScope(true, std::string(kWaitDescription));

  if (const auto* streaming = std::get_if<StreamingStrategy>(&strategy)) {
    return RunStreaming(streaming->service, request);
  }
  if (const auto* synchronous = std::get_if<SynchronousStrategy>(&strategy)) {
    return RunSynchronous(*synchronous->service, request);
  }

  logger_->debug(
      "BoundedExecutor has no strategy for {}", request.document.uri);
  return HandledOutcome{};
}

auto BoundedExecutor::RunSynchronous(
    SynchronousImplementationService& service, const LookupRequest& request)
    -> std::expected<LookupOutcome, ImplnavError> {
  logger_->debug(
      "BoundedExecutor running synchronous lookup: {} {}:{}",
      request.document.uri, request.position.line, request.position.character);

  SynchronousLookupResult result;
  try {
    result = service.TryGoToImplementation(
        request.document, request.position, request.cancellation_token);
  } catch (const std::exception& e) {
    if (request.cancellation_token.stop_requested()) {
      return ImplnavError::Unexpected(ImplnavErrorCode::Cancelled);
    }
    logger_->error("Synchronous lookup failed: {}", e.what());
    return ImplnavError::Unexpected(ImplnavErrorCode::SearchFailed, e.what());
  }

  if (request.cancellation_token.stop_requested()) {
    return ImplnavError::Unexpected(ImplnavErrorCode::Cancelled);
  }
  if (result.message.has_value() && !result.message->empty()) {
    return MessageOutcome{.message = std::move(*result.message)};
  }
  if (!result.handled) {
    logger_->debug(
        "Synchronous lookup did not handle {}", request.document.uri);
  }
  return HandledOutcome{};
}

auto BoundedExecutor::RunStreaming(
    std::shared_ptr<StreamingImplementationService> service,
    const LookupRequest& request)
    -> std::expected<LookupOutcome, ImplnavError> {
  logger_->debug(
      "BoundedExecutor running streaming lookup: {} {}:{}",
      request.document.uri, request.position.line, request.position.character);

  // Fresh collector per request; nothing is surfaced until the search ends
  auto context =
      std::make_shared<SimpleFindUsagesContext>(request.cancellation_token);

  auto search = service->FindImplementations(
      request.document, request.position, context);
  auto completion = utils::AwaitOrCancel(
      search_executor_, std::move(search), request.cancellation_token,
      logger_);
  if (!completion) {
    return std::unexpected(completion.error());
  }

  if (auto message = context->Message()) {
    return MessageOutcome{.message = std::move(*message)};
  }

  auto definitions = context->GetDefinitions();
  logger_->debug(
      "Streaming lookup found {} definition(s) for {}", definitions.size(),
      request.document.uri);
  return DefinitionsOutcome{
      .search_title = context->SearchTitle(),
      .definitions = std::move(definitions),
  };
}

}  // namespace implnav::features
