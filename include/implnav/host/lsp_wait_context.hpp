#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>

#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <lsp/basic.hpp>
#include <spdlog/spdlog.h>

#include "implnav/commanding/wait_context.hpp"
#include "implnav/host/client_channel.hpp"

namespace implnav::host {

// Wait context for one executeCommand request. Each scope is shown as a
// work done progress (create, begin, end) when the client supports it.
// The user cancels through window/workDoneProgress/cancel, which the
// server forwards to Cancel().
class LspWaitContext : public WaitContext {
 public:
  LspWaitContext(
      ClientChannel& channel, std::uint64_t request_id,
      bool progress_supported,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ~LspWaitContext() override;

  [[nodiscard]] auto UserCancellationToken() const -> std::stop_token override;

  auto TakeOwnership() -> void override;

  // Requests cancellation if `token` belongs to one of this context's
  // scopes. Returns whether it did.
  auto Cancel(const lsp::ProgressToken& token) -> bool;

  // Cancels regardless of progress token, e.g. on shutdown
  auto CancelAll() -> void;

 protected:
  auto BeginScope(
      std::uint64_t id, bool allow_cancellation, std::string description)
      -> void override;
  auto EndScope(std::uint64_t id) -> void override;

 private:
  struct ProgressScope {
    explicit ProgressScope(
        asio::strand<asio::any_io_executor> strand, lsp::ProgressToken token)
        : token(std::move(token)), timer(strand) {
    }

    lsp::ProgressToken token;
    asio::steady_timer timer;
    bool ended = false;
  };

  static auto RunProgress(
      ClientChannel& channel, std::shared_ptr<ProgressScope> scope,
      bool allow_cancellation, std::string description,
      std::shared_ptr<spdlog::logger> logger) -> asio::awaitable<void>;

  auto FinishScope(std::shared_ptr<ProgressScope> scope) -> void;

  ClientChannel& channel_;
  std::uint64_t request_id_;
  bool progress_supported_;
  std::shared_ptr<spdlog::logger> logger_;

  // Serializes each scope's progress messages with its end signal
  asio::strand<asio::any_io_executor> strand_;

  std::stop_source stop_source_;

  std::mutex mutex_;
  std::unordered_map<std::uint64_t, std::shared_ptr<ProgressScope>> scopes_;
  // Tokens of every scope ever opened, so a late cancel still matches
  std::unordered_map<lsp::ProgressToken, std::uint64_t> tokens_;
};

}  // namespace implnav::host
