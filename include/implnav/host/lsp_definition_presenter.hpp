#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "implnav/find_usages/definition_presenter.hpp"
#include "implnav/host/client_channel.hpp"

namespace implnav::host {

// Zero items: an information message. One item: opened directly. Several:
// sent to the client as implnav/presentDefinitions for it to list.
class LspDefinitionPresenter : public DefinitionPresenter {
 public:
  explicit LspDefinitionPresenter(
      ClientChannel& channel, std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto GetExecutor() const -> asio::any_io_executor override;

  auto TryNavigateToOrPresentItems(
      std::string title, std::vector<DefinitionItem> items)
      -> asio::awaitable<bool> override;

  static auto NoResultsMessage(const std::string& title) -> std::string;

 private:
  ClientChannel& channel_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace implnav::host
