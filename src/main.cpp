#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/transport/framed_pipe_transport.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "implnav/find_usages/language_service_registry.hpp"
#include "implnav/host/implnav_lsp_server.hpp"

using implnav::LanguageServiceRegistry;
using implnav::host::ImplnavLspServer;
using jsonrpc::endpoint::RpcEndpoint;
using jsonrpc::transport::FramedPipeTransport;

auto main(int argc, char* argv[]) -> int {
  const std::vector<std::string> args(argv, argv + argc);
  auto pipe_name = app::ParsePipeName(args);
  if (!pipe_name) {
    spdlog::error("Usage: implnav --pipe=<pipe name>");
    return 1;
  }

  auto loggers = app::SetupLoggers();

  asio::io_context io_context;
  auto executor = io_context.get_executor();

  auto transport = std::make_unique<FramedPipeTransport>(
      executor, *pipe_name, false, loggers["transport"]);
  auto endpoint = std::make_unique<RpcEndpoint>(
      executor, std::move(transport), loggers["jsonrpc"]);

  // Language integrations register their lookup services here
  auto registry = std::make_shared<LanguageServiceRegistry>(loggers["implnav"]);

  auto server = std::make_unique<ImplnavLspServer>(
      executor, std::move(endpoint), registry, loggers["implnav"]);

  asio::co_spawn(
      io_context,
      [&server]() -> asio::awaitable<void> {
        auto result = co_await server->Start();
        if (!result.has_value()) {
          spdlog::error("Server error: {}", result.error().Message());
        }
      },
      asio::detached);

  io_context.run();
  return 0;
}
