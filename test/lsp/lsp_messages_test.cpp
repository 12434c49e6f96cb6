#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "lsp/lifecycle.hpp"
#include "lsp/window.hpp"
#include "lsp/workspace.hpp"

TEST_CASE("ExecuteCommandParams deserialization", "[lsp]") {
  auto j = nlohmann::json::parse(R"({
    "command": "implnav.goToImplementation",
    "arguments": [
      {"textDocument": {"uri": "file:///top.sv"},
       "position": {"line": 3, "character": 7}}
    ]
  })");

  auto params = j.get<lsp::ExecuteCommandParams>();

  REQUIRE(params.command == "implnav.goToImplementation");
  REQUIRE(params.arguments.has_value());
  REQUIRE(params.arguments->size() == 1);
  REQUIRE_FALSE(params.workDoneToken.has_value());

  auto position = params.arguments->front().get<lsp::TextDocumentPositionParams>();
  REQUIRE(position.textDocument.uri == "file:///top.sv");
  REQUIRE(position.position.line == 3);
  REQUIRE(position.position.character == 7);
}

TEST_CASE("Work done progress values carry their kind", "[lsp]") {
  lsp::ProgressParams<lsp::WorkDoneProgressBegin> begin{
      .token = "implnav/1/1",
      .value = {.title = "Locating implementations...", .cancellable = true},
  };
  nlohmann::json begin_json = begin;

  REQUIRE(begin_json["token"] == "implnav/1/1");
  REQUIRE(begin_json["value"]["kind"] == "begin");
  REQUIRE(begin_json["value"]["title"] == "Locating implementations...");
  REQUIRE(begin_json["value"]["cancellable"] == true);
  REQUIRE_FALSE(begin_json["value"].contains("message"));

  lsp::ProgressParams<lsp::WorkDoneProgressEnd> end{.token = "implnav/1/1"};
  nlohmann::json end_json = end;

  REQUIRE(end_json["value"]["kind"] == "end");
  REQUIRE_FALSE(end_json["value"].contains("message"));
}

TEST_CASE("ShowDocumentParams omits unset fields", "[lsp]") {
  lsp::ShowDocumentParams params{.uri = "file:///impl.sv"};
  nlohmann::json j = params;

  REQUIRE(j == nlohmann::json{{"uri", "file:///impl.sv"}});

  params.takeFocus = true;
  params.selection = lsp::Range{
      .start = {.line = 1, .character = 2}, .end = {.line = 1, .character = 6}};
  j = params;

  REQUIRE(j["takeFocus"] == true);
  REQUIRE(j["selection"]["end"]["character"] == 6);
}

TEST_CASE("InitializeParams reads window capabilities", "[lsp]") {
  auto j = nlohmann::json::parse(R"({
    "processId": 42,
    "rootUri": "file:///workspace",
    "capabilities": {
      "window": {"workDoneProgress": true, "showDocument": {"support": true}}
    },
    "workspaceFolders": [{"uri": "file:///workspace", "name": "workspace"}]
  })");

  auto params = j.get<lsp::InitializeParams>();

  REQUIRE(params.processId == 42);
  REQUIRE(params.capabilities.has_value());
  REQUIRE(params.capabilities->window.has_value());
  REQUIRE(params.capabilities->window->workDoneProgress == true);
  REQUIRE(params.capabilities->window->showDocument->support);
  REQUIRE(params.workspaceFolders->size() == 1);
}

TEST_CASE("ServerCapabilities advertises commands", "[lsp]") {
  lsp::ServerCapabilities capabilities{
      .textDocumentSync =
          lsp::TextDocumentSyncOptions{
              .openClose = true, .change = lsp::TextDocumentSyncKind::kFull},
      .executeCommandProvider =
          lsp::ExecuteCommandOptions{.commands = {"implnav.goToImplementation"}},
  };
  nlohmann::json j = capabilities;

  REQUIRE(j["textDocumentSync"]["change"] == 1);
  REQUIRE(
      j["executeCommandProvider"]["commands"] ==
      nlohmann::json::array({"implnav.goToImplementation"}));
}

TEST_CASE("FileEvent rejects unknown change types", "[lsp]") {
  auto valid = nlohmann::json::parse(R"({"uri": "file:///.implnav", "type": 2})");
  REQUIRE(valid.get<lsp::FileEvent>().type == lsp::FileChangeType::kChanged);

  auto invalid =
      nlohmann::json::parse(R"({"uri": "file:///.implnav", "type": 9})");
  REQUIRE_THROWS(invalid.get<lsp::FileEvent>());
}
