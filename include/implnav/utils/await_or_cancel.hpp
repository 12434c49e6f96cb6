#pragma once

#include <expected>
#include <exception>
#include <memory>
#include <stop_token>
#include <system_error>
#include <type_traits>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/bind_cancellation_slot.hpp>
#include <asio/cancellation_signal.hpp>
#include <asio/co_spawn.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/strand.hpp>
#include <asio/use_future.hpp>
#include <spdlog/spdlog.h>

#include "implnav/error/error.hpp"

namespace implnav::utils {

namespace detail {

// The signal is only emitted on the strand the task was spawned on, and is
// shared so a late stop request can still post to it after the wait ends.
struct CancellationBridge {
  explicit CancellationBridge(asio::any_io_executor executor)
      : strand(asio::make_strand(executor)) {
  }

  asio::strand<asio::any_io_executor> strand;
  asio::cancellation_signal signal;
};

}  // namespace detail

// Blocks the calling thread until `task` finishes on `executor` or
// `cancellation_token` is triggered. A stop request is delivered to the
// task as asio terminal cancellation, and the call still waits for the
// task to unwind so nothing it touches outlives the wait.
//
// Returns kCancelled when the token fired (even if the task managed to
// finish), and kSearchFailed when the task threw.
//
// Must not be called from a thread that is needed to run `executor`.
template <typename T>
auto AwaitOrCancel(
    asio::any_io_executor executor, asio::awaitable<T> task,
    std::stop_token cancellation_token,
    std::shared_ptr<spdlog::logger> logger = nullptr)
    -> std::expected<T, ImplnavError> {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  if (cancellation_token.stop_requested()) {
    return ImplnavError::Unexpected(ImplnavErrorCode::Cancelled);
  }

  auto bridge = std::make_shared<detail::CancellationBridge>(executor);
  auto future = asio::co_spawn(
      bridge->strand, std::move(task),
      asio::bind_cancellation_slot(bridge->signal.slot(), asio::use_future));

  std::stop_callback on_stop(cancellation_token, [bridge]() {
    asio::post(bridge->strand, [bridge]() {
      bridge->signal.emit(asio::cancellation_type::terminal);
    });
  });

  try {
    if constexpr (std::is_void_v<T>) {
      future.get();
      if (cancellation_token.stop_requested()) {
        return ImplnavError::Unexpected(ImplnavErrorCode::Cancelled);
      }
      return {};
    } else {
      auto value = future.get();
      if (cancellation_token.stop_requested()) {
        return ImplnavError::Unexpected(ImplnavErrorCode::Cancelled);
      }
      return value;
    }
  } catch (const std::system_error& e) {
    if (e.code() == asio::error::operation_aborted ||
        cancellation_token.stop_requested()) {
      return ImplnavError::Unexpected(ImplnavErrorCode::Cancelled);
    }
    logger->error("AwaitOrCancel task failed: {}", e.what());
    return ImplnavError::Unexpected(ImplnavErrorCode::SearchFailed, e.what());
  } catch (const std::exception& e) {
    if (cancellation_token.stop_requested()) {
      return ImplnavError::Unexpected(ImplnavErrorCode::Cancelled);
    }
    logger->error("AwaitOrCancel task failed: {}", e.what());
    return ImplnavError::Unexpected(ImplnavErrorCode::SearchFailed, e.what());
  }
}

}  // namespace implnav::utils
