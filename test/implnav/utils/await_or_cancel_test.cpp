#include "implnav/utils/await_or_cancel.hpp"

#include <stdexcept>
#include <stop_token>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using implnav::ImplnavErrorCode;
using implnav::utils::AwaitOrCancel;

namespace {

auto WaitForever() -> asio::awaitable<int> {
  asio::steady_timer timer(co_await asio::this_coro::executor);
  timer.expires_at(asio::steady_timer::time_point::max());
  co_await timer.async_wait(asio::use_awaitable);
  co_return 0;
}

}  // namespace

TEST_CASE("AwaitOrCancel returns the task's value", "[await_or_cancel]") {
  asio::thread_pool pool(2);
  std::stop_source source;

  auto task = []() -> asio::awaitable<int> { co_return 42; };
  auto result =
      AwaitOrCancel(pool.get_executor(), task(), source.get_token());

  REQUIRE(result.has_value());
  REQUIRE(*result == 42);
  pool.join();
}

TEST_CASE("AwaitOrCancel supports void tasks", "[await_or_cancel]") {
  asio::thread_pool pool(1);
  std::stop_source source;
  bool ran = false;

  auto task = [&ran]() -> asio::awaitable<void> {
    ran = true;
    co_return;
  };
  auto result =
      AwaitOrCancel(pool.get_executor(), task(), source.get_token());

  REQUIRE(result.has_value());
  REQUIRE(ran);
  pool.join();
}

TEST_CASE(
    "AwaitOrCancel does not start the task when already cancelled",
    "[await_or_cancel]") {
  asio::thread_pool pool(1);
  std::stop_source source;
  source.request_stop();
  bool ran = false;

  auto task = [&ran]() -> asio::awaitable<int> {
    ran = true;
    co_return 1;
  };
  auto result =
      AwaitOrCancel(pool.get_executor(), task(), source.get_token());

  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().code() == ImplnavErrorCode::Cancelled);
  REQUIRE_FALSE(ran);
  pool.join();
}

TEST_CASE(
    "AwaitOrCancel interrupts a running task on stop request",
    "[await_or_cancel]") {
  asio::thread_pool pool(2);
  std::stop_source source;

  auto task = [&source]() -> asio::awaitable<int> {
    source.request_stop();
    co_return co_await WaitForever();
  };
  auto result =
      AwaitOrCancel(pool.get_executor(), task(), source.get_token());

  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().code() == ImplnavErrorCode::Cancelled);
  pool.join();
}

TEST_CASE(
    "AwaitOrCancel reports cancellation even if the task finished",
    "[await_or_cancel]") {
  asio::thread_pool pool(1);
  std::stop_source source;

  auto task = [&source]() -> asio::awaitable<int> {
    source.request_stop();
    co_return 7;
  };
  auto result =
      AwaitOrCancel(pool.get_executor(), task(), source.get_token());

  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().code() == ImplnavErrorCode::Cancelled);
  pool.join();
}

TEST_CASE("AwaitOrCancel maps exceptions to SearchFailed", "[await_or_cancel]") {
  asio::thread_pool pool(1);
  std::stop_source source;

  auto task = []() -> asio::awaitable<int> {
    throw std::runtime_error("index unavailable");
    co_return 0;
  };
  auto result =
      AwaitOrCancel(pool.get_executor(), task(), source.get_token());

  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().code() == ImplnavErrorCode::SearchFailed);
  REQUIRE_THAT(
      result.error().message(),
      Catch::Matchers::ContainsSubstring("index unavailable"));
  pool.join();
}
