#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <lsp/basic.hpp>
#include <spdlog/spdlog.h>

#include "implnav/host/lsp_wait_context.hpp"

namespace implnav::host {

// Wait contexts of the executeCommand requests in flight, so progress
// cancellation and shutdown can reach them.
class WaitContextRegistry {
 public:
  // Keeps a context registered for as long as it lives
  class Registration {
   public:
    Registration(WaitContextRegistry& registry, std::uint64_t request_id);
    ~Registration();

    Registration(const Registration&) = delete;
    Registration(Registration&&) = delete;
    auto operator=(const Registration&) -> Registration& = delete;
    auto operator=(Registration&&) -> Registration& = delete;

   private:
    WaitContextRegistry* registry_;
    std::uint64_t request_id_;
  };

  explicit WaitContextRegistry(
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto Register(
      std::uint64_t request_id, std::shared_ptr<LspWaitContext> context)
      -> Registration;

  // Forwards a window/workDoneProgress/cancel to the context owning
  // `token`. Returns whether one did.
  auto Cancel(const lsp::ProgressToken& token) -> bool;

  auto CancelAll() -> void;

  [[nodiscard]] auto Size() const -> std::size_t;

 private:
  auto Remove(std::uint64_t request_id) -> void;

  std::shared_ptr<spdlog::logger> logger_;
  mutable std::mutex mutex_;
  std::unordered_map<std::uint64_t, std::shared_ptr<LspWaitContext>>
      contexts_;
};

}  // namespace implnav::host
