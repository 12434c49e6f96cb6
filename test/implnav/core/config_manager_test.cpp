#include "implnav/core/config_manager.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/implnav/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using implnav::ConfigManager;
using implnav::test::FileTestFixture;

TEST_CASE("ConfigManager uses defaults without a workspace", "[config]") {
  ConfigManager manager;

  REQUIRE_FALSE(manager.HasConfigFile());
  REQUIRE(manager.IsStreamingGoToImplementationEnabled("systemverilog"));
}

TEST_CASE("ConfigManager loads config from workspace root", "[config]") {
  FileTestFixture fixture("implnav_config_manager_load");
  fixture.CreateFile(".implnav", R"(
GoToImplementation:
  Languages:
    systemverilog:
      Streaming: false
)");

  ConfigManager manager;
  REQUIRE(manager.LoadFromWorkspace(fixture.GetTempDir()));

  REQUIRE(manager.HasConfigFile());
  REQUIRE_FALSE(manager.IsStreamingGoToImplementationEnabled("systemverilog"));
  REQUIRE(manager.IsStreamingGoToImplementationEnabled("cpp"));
}

TEST_CASE("ConfigManager picks up edits on reload", "[config]") {
  FileTestFixture fixture("implnav_config_manager_reload");

  ConfigManager manager;
  REQUIRE_FALSE(manager.LoadFromWorkspace(fixture.GetTempDir()));
  REQUIRE(manager.IsStreamingGoToImplementationEnabled("systemverilog"));

  fixture.CreateFile(".implnav", R"(
GoToImplementation:
  Streaming: false
)");
  REQUIRE(manager.HandleConfigFileChange());
  REQUIRE_FALSE(manager.IsStreamingGoToImplementationEnabled("systemverilog"));

  // Deleting the file restores the defaults
  fixture.RemoveFile(".implnav");
  REQUIRE_FALSE(manager.HandleConfigFileChange());
  REQUIRE_FALSE(manager.HasConfigFile());
  REQUIRE(manager.IsStreamingGoToImplementationEnabled("systemverilog"));
}

TEST_CASE("ConfigManager falls back to defaults on parse error", "[config]") {
  FileTestFixture fixture("implnav_config_manager_invalid");
  fixture.CreateFile(".implnav", "GoToImplementation: [\n");

  ConfigManager manager;
  REQUIRE_FALSE(manager.LoadFromWorkspace(fixture.GetTempDir()));
  REQUIRE(manager.IsStreamingGoToImplementationEnabled("systemverilog"));
}
