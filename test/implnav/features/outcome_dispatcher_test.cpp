#include "implnav/features/go_to_implementation/outcome_dispatcher.hpp"

#include <memory>
#include <stdexcept>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/implnav/common/fakes.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using implnav::DefinitionPresenter;
using implnav::NotificationSeverity;
using implnav::PresenterProvider;
using implnav::features::NavigateAction;
using implnav::features::OutcomeDispatcher;
using implnav::features::PresentAction;
using implnav::features::ShowMessageAction;
using implnav::test::FakeDefinitionPresenter;
using implnav::test::FakeNavigationSink;
using implnav::test::FakeNotificationSink;
using implnav::test::FakeWaitContext;
using implnav::test::MakeDefinition;

class OutcomeDispatcherFixture {
 public:
  OutcomeDispatcherFixture()
      : notifications_(std::make_shared<FakeNotificationSink>()),
        navigations_(std::make_shared<FakeNavigationSink>()),
        presenter_(std::make_shared<FakeDefinitionPresenter>()),
        presenters_(std::make_shared<PresenterProvider>()),
        dispatcher_(notifications_, navigations_, presenters_) {
    presenters_->AddFactory(
        [presenter = presenter_]() -> std::shared_ptr<DefinitionPresenter> {
          return presenter;
        });
  }

 protected:
  std::shared_ptr<FakeNotificationSink> notifications_;
  std::shared_ptr<FakeNavigationSink> navigations_;
  std::shared_ptr<FakeDefinitionPresenter> presenter_;
  std::shared_ptr<PresenterProvider> presenters_;
  OutcomeDispatcher dispatcher_;
  FakeWaitContext wait_;
};

TEST_CASE_METHOD(
    OutcomeDispatcherFixture, "OutcomeDispatcher shows messages as information",
    "[dispatcher]") {
  dispatcher_.Dispatch(ShowMessageAction{.message = "Nothing to find"}, wait_);

  auto notifications = notifications_->Notifications();
  REQUIRE(notifications.size() == 1);
  REQUIRE(notifications[0].message == "Nothing to find");
  REQUIRE(notifications[0].title == OutcomeDispatcher::kNotificationTitle);
  REQUIRE(notifications[0].severity == NotificationSeverity::kInformation);
  REQUIRE(wait_.TakeOwnershipCalls() == 1);
  REQUIRE(navigations_->Navigations().empty());
}

TEST_CASE_METHOD(
    OutcomeDispatcherFixture, "OutcomeDispatcher navigates to one definition",
    "[dispatcher]") {
  auto d1 = MakeDefinition("impl_a", 5);
  dispatcher_.Dispatch(NavigateAction{.definition = d1}, wait_);

  REQUIRE(navigations_->Navigations() == std::vector{d1});
  REQUIRE(notifications_->Notifications().empty());
  presenter_->RunPending();
  REQUIRE(presenter_->Presentations().empty());
}

TEST_CASE_METHOD(
    OutcomeDispatcherFixture, "OutcomeDispatcher hands lists to the presenter",
    "[dispatcher]") {
  auto d1 = MakeDefinition("impl_a", 5);
  auto d2 = MakeDefinition("impl_b", 9);
  dispatcher_.Dispatch(
      PresentAction{.title = "Implementations", .definitions = {d1, d2}},
      wait_);
  presenter_->RunPending();

  const auto& presentations = presenter_->Presentations();
  REQUIRE(presentations.size() == 1);
  REQUIRE(presentations[0].title == "Implementations");
  REQUIRE(presentations[0].items == std::vector{d1, d2});
  REQUIRE(navigations_->Navigations().empty());
}

TEST_CASE_METHOD(
    OutcomeDispatcherFixture, "OutcomeDispatcher contains presenter failures",
    "[dispatcher]") {
  SECTION("standard exception") {
    presenter_->SetOnPresent(
        []() { throw std::runtime_error("presentation host crashed"); });
  }

  SECTION("foreign exception") {
    presenter_->SetOnPresent([]() { throw 42; });
  }

  dispatcher_.Dispatch(
      PresentAction{
          .title = "Implementations",
          .definitions = {MakeDefinition("impl_a", 1)}},
      wait_);

  REQUIRE_NOTHROW(presenter_->RunPending());
  REQUIRE(presenter_->Presentations().size() == 1);
  REQUIRE(notifications_->Notifications().empty());
  REQUIRE(navigations_->Navigations().empty());
}

TEST_CASE("OutcomeDispatcher drops presentations without a presenter",
          "[dispatcher]") {
  auto notifications = std::make_shared<FakeNotificationSink>();
  auto navigations = std::make_shared<FakeNavigationSink>();
  auto presenters = std::make_shared<PresenterProvider>();
  presenters->AddFactory([]() -> std::shared_ptr<DefinitionPresenter> {
    throw std::runtime_error("no presenter");
  });
  OutcomeDispatcher dispatcher(notifications, navigations, presenters);
  FakeWaitContext wait;

  dispatcher.Dispatch(
      PresentAction{
          .title = "Implementations",
          .definitions = {MakeDefinition("impl_a", 1)}},
      wait);

  REQUIRE(notifications->Notifications().empty());
  REQUIRE(navigations->Navigations().empty());
}
