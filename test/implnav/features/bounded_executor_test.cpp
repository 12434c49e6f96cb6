#include "implnav/features/go_to_implementation/bounded_executor.hpp"

#include <memory>
#include <variant>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/implnav/common/fakes.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using implnav::ImplnavErrorCode;
using implnav::SynchronousLookupResult;
using implnav::features::BoundedExecutor;
using implnav::features::DefinitionsOutcome;
using implnav::features::HandledOutcome;
using implnav::features::LookupRequest;
using implnav::features::MessageOutcome;
using implnav::features::NoStrategy;
using implnav::features::StreamingStrategy;
using implnav::features::SynchronousStrategy;
using implnav::test::FakeStreamingService;
using implnav::test::FakeSynchronousService;
using implnav::test::FakeWaitContext;
using implnav::test::MakeDefinition;
using implnav::test::MakeDocument;

class BoundedExecutorFixture {
 public:
  BoundedExecutorFixture() : executor_(pool_.get_executor()) {
  }

  ~BoundedExecutorFixture() {
    pool_.join();
  }

  BoundedExecutorFixture(const BoundedExecutorFixture&) = delete;
  auto operator=(const BoundedExecutorFixture&)
      -> BoundedExecutorFixture& = delete;
  BoundedExecutorFixture(BoundedExecutorFixture&&) = delete;
  auto operator=(BoundedExecutorFixture&&) -> BoundedExecutorFixture& = delete;

  auto MakeRequest() -> LookupRequest {
    return LookupRequest{
        .document = MakeDocument(),
        .position = {.line = 10, .character = 4},
        .cancellation_token = wait_.UserCancellationToken(),
    };
  }

 protected:
  asio::thread_pool pool_{2};
  BoundedExecutor executor_;
  FakeWaitContext wait_;
};

TEST_CASE_METHOD(
    BoundedExecutorFixture, "BoundedExecutor collects streaming results",
    "[executor]") {
  auto service = std::make_shared<FakeStreamingService>(std::vector{
      MakeDefinition("impl_a", 1), MakeDefinition("impl_b", 2)});
  service->SetTitle("'drive' implementations");

  auto outcome = executor_.Execute(
      StreamingStrategy{.service = service}, MakeRequest(), wait_);

  REQUIRE(outcome.has_value());
  REQUIRE(std::holds_alternative<DefinitionsOutcome>(*outcome));
  const auto& found = std::get<DefinitionsOutcome>(*outcome);
  REQUIRE(found.search_title == "'drive' implementations");
  REQUIRE(found.definitions.size() == 2);
  REQUIRE(found.definitions[0].display_name == "impl_a");
  REQUIRE(found.definitions[1].display_name == "impl_b");
  REQUIRE(service->Calls() == 1);
}

TEST_CASE_METHOD(
    BoundedExecutorFixture, "BoundedExecutor prefers a reported message",
    "[executor]") {
  auto service = std::make_shared<FakeStreamingService>(
      std::vector{MakeDefinition("impl_a", 1)});
  service->SetMessage("Go to implementation is not supported here.");

  auto outcome = executor_.Execute(
      StreamingStrategy{.service = service}, MakeRequest(), wait_);

  REQUIRE(outcome.has_value());
  REQUIRE(std::holds_alternative<MessageOutcome>(*outcome));
  REQUIRE(
      std::get<MessageOutcome>(*outcome).message ==
      "Go to implementation is not supported here.");
}

TEST_CASE_METHOD(
    BoundedExecutorFixture, "BoundedExecutor holds one cancellable scope",
    "[executor]") {
  auto service = std::make_shared<FakeStreamingService>();

  auto outcome = executor_.Execute(
      StreamingStrategy{.service = service}, MakeRequest(), wait_);

  REQUIRE(outcome.has_value());
  auto scopes = wait_.BegunScopes();
  REQUIRE(scopes.size() == 1);
  REQUIRE(scopes[0].allow_cancellation);
  REQUIRE(scopes[0].description == BoundedExecutor::kWaitDescription);
  REQUIRE(wait_.OpenScopeCount() == 0);
  REQUIRE(wait_.EndedScopeCount() == 1);
}

TEST_CASE_METHOD(
    BoundedExecutorFixture, "BoundedExecutor cancels a running search",
    "[executor]") {
  auto service = std::make_shared<FakeStreamingService>(
      std::vector{MakeDefinition("impl_a", 1)});
  service->BlockUntilCancelled([this]() { wait_.Cancel(); });

  auto outcome = executor_.Execute(
      StreamingStrategy{.service = service}, MakeRequest(), wait_);

  REQUIRE_FALSE(outcome.has_value());
  REQUIRE(outcome.error().code() == ImplnavErrorCode::Cancelled);
  REQUIRE(wait_.OpenScopeCount() == 0);
}

TEST_CASE_METHOD(
    BoundedExecutorFixture, "BoundedExecutor reports failed searches",
    "[executor]") {
  auto service = std::make_shared<FakeStreamingService>();
  service->SetError("symbol table corrupted");

  auto outcome = executor_.Execute(
      StreamingStrategy{.service = service}, MakeRequest(), wait_);

  REQUIRE_FALSE(outcome.has_value());
  REQUIRE(outcome.error().code() == ImplnavErrorCode::SearchFailed);
  REQUIRE(wait_.OpenScopeCount() == 0);
  REQUIRE(wait_.EndedScopeCount() == 1);
}

TEST_CASE_METHOD(
    BoundedExecutorFixture, "BoundedExecutor synchronous outcomes",
    "[executor]") {
  SECTION("handled") {
    auto service = std::make_shared<FakeSynchronousService>();
    auto outcome = executor_.Execute(
        SynchronousStrategy{.service = service}, MakeRequest(), wait_);

    REQUIRE(outcome.has_value());
    REQUIRE(std::holds_alternative<HandledOutcome>(*outcome));
    REQUIRE(service->Calls() == 1);
  }

  SECTION("message") {
    auto service = std::make_shared<FakeSynchronousService>(
        SynchronousLookupResult{
            .handled = true, .message = "No implementations found."});
    auto outcome = executor_.Execute(
        SynchronousStrategy{.service = service}, MakeRequest(), wait_);

    REQUIRE(outcome.has_value());
    REQUIRE(std::holds_alternative<MessageOutcome>(*outcome));
  }

  SECTION("cancelled during the call") {
    auto service = std::make_shared<FakeSynchronousService>();
    service->SetOnCall([this](std::stop_token) { wait_.Cancel(); });
    auto outcome = executor_.Execute(
        SynchronousStrategy{.service = service}, MakeRequest(), wait_);

    REQUIRE_FALSE(outcome.has_value());
    REQUIRE(outcome.error().code() == ImplnavErrorCode::Cancelled);
  }

  SECTION("throws") {
    auto service = std::make_shared<FakeSynchronousService>();
    service->SetError("compilation unavailable");
    auto outcome = executor_.Execute(
        SynchronousStrategy{.service = service}, MakeRequest(), wait_);

    REQUIRE_FALSE(outcome.has_value());
    REQUIRE(outcome.error().code() == ImplnavErrorCode::SearchFailed);
    REQUIRE(wait_.EndedScopeCount() == 1);
  }

  SECTION("throws after cancellation") {
    auto service = std::make_shared<FakeSynchronousService>();
    service->SetOnCall([this](std::stop_token) { wait_.Cancel(); });
    service->SetError("interrupted");
    auto outcome = executor_.Execute(
        SynchronousStrategy{.service = service}, MakeRequest(), wait_);

    REQUIRE_FALSE(outcome.has_value());
    REQUIRE(outcome.error().code() == ImplnavErrorCode::Cancelled);
  }

  REQUIRE(wait_.OpenScopeCount() == 0);
}

TEST_CASE_METHOD(
    BoundedExecutorFixture, "BoundedExecutor without strategy does nothing",
    "[executor]") {
  auto outcome = executor_.Execute(NoStrategy{}, MakeRequest(), wait_);

  REQUIRE(outcome.has_value());
  REQUIRE(std::holds_alternative<HandledOutcome>(*outcome));
}
