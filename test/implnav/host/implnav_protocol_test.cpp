#include "implnav/host/implnav_protocol.hpp"

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "test/implnav/common/fakes.hpp"

constexpr auto kLogLevel = spdlog::level::warn;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using implnav::protocol::CommandStateResult;
using implnav::protocol::PresentDefinitionsParams;
using implnav::protocol::PresentedDefinition;
using implnav::test::MakeDefinition;

TEST_CASE("CommandStateResult wire format", "[protocol]") {
  nlohmann::json j = CommandStateResult{.available = true};

  REQUIRE(j == nlohmann::json{{"available", true}});
  REQUIRE_FALSE(
      nlohmann::json{{"available", false}}.get<CommandStateResult>().available);
}

TEST_CASE("PresentDefinitionsParams wire format", "[protocol]") {
  auto d1 = MakeDefinition("impl_a", 2);
  auto d2 = MakeDefinition("impl_b", 5);
  d2.container_name = "pkg::driver";

  PresentDefinitionsParams params{
      .title = "'run' implementations",
      .items =
          {PresentedDefinition::FromItem(d1),
           PresentedDefinition::FromItem(d2)},
  };
  nlohmann::json j = params;

  REQUIRE(j["title"] == "'run' implementations");
  REQUIRE(j["items"].size() == 2);
  REQUIRE(j["items"][0]["displayName"] == "impl_a");
  REQUIRE(j["items"][0]["location"]["uri"] == d1.location.uri);
  REQUIRE_FALSE(j["items"][0].contains("containerName"));
  REQUIRE(j["items"][1]["containerName"] == "pkg::driver");

  auto parsed = j.get<PresentDefinitionsParams>();
  REQUIRE(parsed.items.size() == 2);
  REQUIRE(parsed.items[1].location == d2.location);
  REQUIRE(parsed.items[1].containerName == "pkg::driver");
}
