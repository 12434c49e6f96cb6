#pragma once

#include <atomic>
#include <cstdint>
#include <stop_token>
#include <string>

namespace implnav {

class WaitContext;

// A wait indication opened by WaitContext::AddScope. The indication is
// released when the scope is destroyed, whichever way the caller leaves.
class WaitScope {
 public:
  WaitScope(WaitContext& context, std::uint64_t id);
  ~WaitScope();

  WaitScope(const WaitScope&) = delete;
  WaitScope(WaitScope&&) = delete;
  auto operator=(const WaitScope&) -> WaitScope& = delete;
  auto operator=(WaitScope&&) -> WaitScope& = delete;

  [[nodiscard]] auto Id() const -> std::uint64_t {
    return id_;
  }

 private:
  WaitContext* context_;
  std::uint64_t id_;
};

// Host facility that shows the user a (possibly cancellable) wait
// indication while a command runs and hands out the user's cancellation
// token for it.
class WaitContext {
 public:
  WaitContext() = default;
  WaitContext(const WaitContext&) = delete;
  WaitContext(WaitContext&&) = delete;
  auto operator=(const WaitContext&) -> WaitContext& = delete;
  auto operator=(WaitContext&&) -> WaitContext& = delete;
  virtual ~WaitContext() = default;

  [[nodiscard]] auto AddScope(bool allow_cancellation, std::string description)
      -> WaitScope;

  [[nodiscard]] virtual auto UserCancellationToken() const
      -> std::stop_token = 0;

  // The command is about to show its own modal UI. The host must not keep
  // (or later show) its wait indication on top of it.
  virtual auto TakeOwnership() -> void = 0;

 protected:
  virtual auto BeginScope(
      std::uint64_t id, bool allow_cancellation, std::string description)
      -> void = 0;
  virtual auto EndScope(std::uint64_t id) -> void = 0;

 private:
  friend class WaitScope;

  std::atomic<std::uint64_t> next_scope_id_{1};
};

}  // namespace implnav
