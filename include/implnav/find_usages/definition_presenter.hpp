#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <spdlog/spdlog.h>

#include "implnav/find_usages/definition_item.hpp"

namespace implnav {

// Presents a finished result set. Decides on its own how to show zero or
// several items; returns whether anything was shown.
class DefinitionPresenter {
 public:
  DefinitionPresenter() = default;
  DefinitionPresenter(const DefinitionPresenter&) = delete;
  DefinitionPresenter(DefinitionPresenter&&) = delete;
  auto operator=(const DefinitionPresenter&) -> DefinitionPresenter& = delete;
  auto operator=(DefinitionPresenter&&) -> DefinitionPresenter& = delete;
  virtual ~DefinitionPresenter() = default;

  // Executor the presentation coroutine is spawned on
  [[nodiscard]] virtual auto GetExecutor() const -> asio::any_io_executor = 0;

  virtual auto TryNavigateToOrPresentItems(
      std::string title, std::vector<DefinitionItem> items)
      -> asio::awaitable<bool> = 0;
};

// Process-wide lookup of the optional presenter. Presenters are built
// lazily by the first registered factory and memoized. A factory that
// throws leaves the presenter unavailable rather than failing the caller;
// the next lookup tries again.
class PresenterProvider {
 public:
  using Factory = std::function<std::shared_ptr<DefinitionPresenter>()>;

  explicit PresenterProvider(std::shared_ptr<spdlog::logger> logger = nullptr);

  auto AddFactory(Factory factory) -> void;

  [[nodiscard]] auto TryGetPresenter()
      -> std::optional<std::shared_ptr<DefinitionPresenter>>;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  std::mutex mutex_;
  std::vector<Factory> factories_;
  std::shared_ptr<DefinitionPresenter> presenter_;
};

}  // namespace implnav
