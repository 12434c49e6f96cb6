#include "implnav/find_usages/language_service_registry.hpp"

#include <memory>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/implnav/common/fakes.hpp"

constexpr auto kLogLevel = spdlog::level::warn;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using implnav::IsAvailable;
using implnav::LanguageServiceRegistry;
using implnav::test::FakeStreamingService;
using implnav::test::FakeSynchronousService;
using implnav::test::MakeDocument;

TEST_CASE("LanguageServiceRegistry resolves by language", "[registry]") {
  LanguageServiceRegistry registry;
  auto streaming = std::make_shared<FakeStreamingService>();
  auto synchronous = std::make_shared<FakeSynchronousService>();
  registry.RegisterStreamingService("systemverilog", streaming);
  registry.RegisterSynchronousService("systemverilog", synchronous);
  registry.RegisterSynchronousService("cpp", synchronous);

  auto sv = registry.Resolve(MakeDocument("systemverilog"));
  REQUIRE(sv.streaming == streaming);
  REQUIRE(sv.synchronous == synchronous);
  REQUIRE(IsAvailable(sv));

  auto cpp = registry.Resolve(MakeDocument("cpp"));
  REQUIRE(cpp.streaming == nullptr);
  REQUIRE(cpp.synchronous == synchronous);
  REQUIRE(IsAvailable(cpp));
}

TEST_CASE("LanguageServiceRegistry unknown language has nothing",
          "[registry]") {
  LanguageServiceRegistry registry;
  registry.RegisterStreamingService(
      "systemverilog", std::make_shared<FakeStreamingService>());

  auto capabilities = registry.Resolve(MakeDocument("plaintext"));
  REQUIRE(capabilities.streaming == nullptr);
  REQUIRE(capabilities.synchronous == nullptr);
  REQUIRE_FALSE(IsAvailable(capabilities));
}
