#include "implnav/host/lsp_wait_context.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <fmt/format.h>

namespace implnav::host {

LspWaitContext::LspWaitContext(
    ClientChannel& channel, std::uint64_t request_id, bool progress_supported,
    std::shared_ptr<spdlog::logger> logger)
    : channel_(channel),
      request_id_(request_id),
      progress_supported_(progress_supported),
      logger_(logger ? logger : spdlog::default_logger()),
      strand_(asio::make_strand(channel.GetExecutor())) {
}

LspWaitContext::~LspWaitContext() {
  TakeOwnership();
}

auto LspWaitContext::UserCancellationToken() const -> std::stop_token {
  return stop_source_.get_token();
}

auto LspWaitContext::TakeOwnership() -> void {
  std::unordered_map<std::uint64_t, std::shared_ptr<ProgressScope>> scopes;
  {
    std::lock_guard lock(mutex_);
    scopes.swap(scopes_);
  }
  for (auto& [id, scope] : scopes) {
    FinishScope(std::move(scope));
  }
}

auto LspWaitContext::Cancel(const lsp::ProgressToken& token) -> bool {
  {
    std::lock_guard lock(mutex_);
    if (!tokens_.contains(token)) {
      return false;
    }
  }
  logger_->debug("LspWaitContext request {} cancelled by user", request_id_);
  stop_source_.request_stop();
  return true;
}

auto LspWaitContext::CancelAll() -> void {
  stop_source_.request_stop();
}

auto LspWaitContext::BeginScope(
    std::uint64_t id, bool allow_cancellation, std::string description)
    -> void {
  if (!progress_supported_) {
    logger_->debug(
        "LspWaitContext client has no work done progress, skipping '{}'",
        description);
    return;
  }

  auto token = fmt::format("implnav/{}/{}", request_id_, id);
  auto scope = std::make_shared<ProgressScope>(strand_, token);
  {
    std::lock_guard lock(mutex_);
    scopes_.emplace(id, scope);
    tokens_.emplace(token, id);
  }

  asio::co_spawn(
      strand_,
      RunProgress(
          channel_, std::move(scope), allow_cancellation,
          std::move(description), logger_),
      asio::detached);
}

auto LspWaitContext::EndScope(std::uint64_t id) -> void {
  std::shared_ptr<ProgressScope> scope;
  {
    std::lock_guard lock(mutex_);
    auto it = scopes_.find(id);
    if (it == scopes_.end()) {
      return;
    }
    scope = std::move(it->second);
    scopes_.erase(it);
  }
  FinishScope(std::move(scope));
}

auto LspWaitContext::FinishScope(std::shared_ptr<ProgressScope> scope)
    -> void {
  asio::post(strand_, [scope = std::move(scope)]() {
    scope->ended = true;
    scope->timer.cancel();
  });
}

auto LspWaitContext::RunProgress(
    ClientChannel& channel, std::shared_ptr<ProgressScope> scope,
    bool allow_cancellation, std::string description,
    std::shared_ptr<spdlog::logger> logger) -> asio::awaitable<void> {
  auto created = co_await channel.SendWorkDoneProgressCreate(
      lsp::WorkDoneProgressCreateParams{.token = scope->token});
  if (!created) {
    logger->warn(
        "LspWaitContext failed to create progress {}: {}", scope->token,
        created.error().Message());
    co_return;
  }

  auto begun = co_await channel.SendProgressBegin(
      lsp::ProgressParams<lsp::WorkDoneProgressBegin>{
          .token = scope->token,
          .value =
              lsp::WorkDoneProgressBegin{
                  .title = description,
                  .cancellable = allow_cancellation,
              },
      });
  if (!begun) {
    logger->warn(
        "LspWaitContext failed to begin progress {}: {}", scope->token,
        begun.error().Message());
  }

  // Ended while the create request was in flight
  if (!scope->ended) {
    scope->timer.expires_at(asio::steady_timer::time_point::max());
    std::error_code ec;
    co_await scope->timer.async_wait(
        asio::redirect_error(asio::use_awaitable, ec));
  }

  auto ended = co_await channel.SendProgressEnd(
      lsp::ProgressParams<lsp::WorkDoneProgressEnd>{
          .token = scope->token,
          .value = lsp::WorkDoneProgressEnd{},
      });
  if (!ended) {
    logger->warn(
        "LspWaitContext failed to end progress {}: {}", scope->token,
        ended.error().Message());
  }
}

}  // namespace implnav::host
