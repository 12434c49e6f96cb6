#include "implnav/host/wait_context_registry.hpp"

namespace implnav::host {

WaitContextRegistry::Registration::Registration(
    WaitContextRegistry& registry, std::uint64_t request_id)
    : registry_(&registry), request_id_(request_id) {
}

WaitContextRegistry::Registration::~Registration() {
  registry_->Remove(request_id_);
}

WaitContextRegistry::WaitContextRegistry(
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto WaitContextRegistry::Register(
    std::uint64_t request_id, std::shared_ptr<LspWaitContext> context)
    -> Registration {
  {
    std::lock_guard lock(mutex_);
    contexts_.insert_or_assign(request_id, std::move(context));
  }
  return Registration(*this, request_id);
}

auto WaitContextRegistry::Cancel(const lsp::ProgressToken& token) -> bool {
  std::lock_guard lock(mutex_);
  for (auto& [id, context] : contexts_) {
    if (context->Cancel(token)) {
      logger_->debug("Cancelled request {} via progress {}", id, token);
      return true;
    }
  }
  return false;
}

auto WaitContextRegistry::CancelAll() -> void {
  std::lock_guard lock(mutex_);
  for (auto& [id, context] : contexts_) {
    context->CancelAll();
  }
}

auto WaitContextRegistry::Size() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return contexts_.size();
}

auto WaitContextRegistry::Remove(std::uint64_t request_id) -> void {
  std::shared_ptr<LspWaitContext> context;
  {
    std::lock_guard lock(mutex_);
    auto it = contexts_.find(request_id);
    if (it == contexts_.end()) {
      return;
    }
    context = std::move(it->second);
    contexts_.erase(it);
  }
  // Destroyed outside the lock; it ends any progress still shown
}

}  // namespace implnav::host
