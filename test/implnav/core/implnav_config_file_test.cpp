#include "implnav/core/implnav_config_file.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/implnav/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using implnav::ImplnavConfigFile;
using implnav::test::FileTestFixture;

TEST_CASE("ImplnavConfigFile defaults enable streaming", "[config]") {
  auto config = ImplnavConfigFile::CreateDefault();

  REQUIRE(config.GetDefaultStreaming());
  REQUIRE(config.IsStreamingGoToImplementationEnabled("systemverilog"));
  REQUIRE_FALSE(config.GetLanguageStreaming("systemverilog").has_value());
}

TEST_CASE("ImplnavConfigFile missing file returns nullopt", "[config]") {
  FileTestFixture fixture("implnav_config_missing");

  auto config =
      ImplnavConfigFile::LoadFromFile(fixture.GetTempDir() / ".implnav");

  REQUIRE_FALSE(config.has_value());
}

TEST_CASE("ImplnavConfigFile global streaming toggle", "[config]") {
  FileTestFixture fixture("implnav_config_global");
  auto path = fixture.CreateFile(".implnav", R"(
GoToImplementation:
  Streaming: false
)");

  auto config = ImplnavConfigFile::LoadFromFile(path);

  REQUIRE(config.has_value());
  REQUIRE_FALSE(config->GetDefaultStreaming());
  REQUIRE_FALSE(config->IsStreamingGoToImplementationEnabled("cpp"));
  REQUIRE_FALSE(config->IsStreamingGoToImplementationEnabled("systemverilog"));
}

TEST_CASE("ImplnavConfigFile per-language override wins", "[config]") {
  FileTestFixture fixture("implnav_config_language");
  auto path = fixture.CreateFile(".implnav", R"(
GoToImplementation:
  Streaming: true
  Languages:
    systemverilog:
      Streaming: false
    cpp:
      Streaming: true
)");

  auto config = ImplnavConfigFile::LoadFromFile(path);

  REQUIRE(config.has_value());
  REQUIRE_FALSE(config->IsStreamingGoToImplementationEnabled("systemverilog"));
  REQUIRE(config->IsStreamingGoToImplementationEnabled("cpp"));
  // Languages without an entry fall back to the global value
  REQUIRE(config->IsStreamingGoToImplementationEnabled("rust"));
  REQUIRE(config->GetLanguageStreaming("systemverilog") == false);
}

TEST_CASE("ImplnavConfigFile without section keeps defaults", "[config]") {
  FileTestFixture fixture("implnav_config_other");
  auto path = fixture.CreateFile(".implnav", R"(
SomethingElse:
  Key: value
)");

  auto config = ImplnavConfigFile::LoadFromFile(path);

  REQUIRE(config.has_value());
  REQUIRE(config->GetDefaultStreaming());
}

TEST_CASE("ImplnavConfigFile malformed YAML returns nullopt", "[config]") {
  FileTestFixture fixture("implnav_config_malformed");
  auto path = fixture.CreateFile(".implnav", R"(
GoToImplementation:
  Streaming: [unterminated
)");

  REQUIRE_FALSE(ImplnavConfigFile::LoadFromFile(path).has_value());
}

TEST_CASE("ImplnavConfigFile non-boolean toggle returns nullopt", "[config]") {
  FileTestFixture fixture("implnav_config_bad_type");
  auto path = fixture.CreateFile(".implnav", R"(
GoToImplementation:
  Streaming: sometimes
)");

  REQUIRE_FALSE(ImplnavConfigFile::LoadFromFile(path).has_value());
}
