#pragma once

#include <memory>

#include <spdlog/spdlog.h>

#include "implnav/commanding/outcome_sinks.hpp"
#include "implnav/host/client_channel.hpp"

namespace implnav::host {

// Both sinks are called from command threads. They hand the message to the
// channel's executor and return without waiting for the client.

class LspNotificationSink : public NotificationSink {
 public:
  explicit LspNotificationSink(
      ClientChannel& channel, std::shared_ptr<spdlog::logger> logger = nullptr);

  auto Notify(
      std::string message, std::string title, NotificationSeverity severity)
      -> void override;

 private:
  ClientChannel& channel_;
  std::shared_ptr<spdlog::logger> logger_;
};

class LspNavigationSink : public NavigationSink {
 public:
  explicit LspNavigationSink(
      ClientChannel& channel, std::shared_ptr<spdlog::logger> logger = nullptr);

  auto NavigateTo(const DefinitionItem& definition) -> void override;

 private:
  ClientChannel& channel_;
  std::shared_ptr<spdlog::logger> logger_;
};

// showDocument parameters that open `definition` with the range selected
auto MakeShowDocumentParams(const DefinitionItem& definition)
    -> lsp::ShowDocumentParams;

auto ToMessageType(NotificationSeverity severity) -> lsp::MessageType;

}  // namespace implnav::host
