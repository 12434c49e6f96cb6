#include "implnav/commanding/wait_context.hpp"

namespace implnav {

WaitScope::WaitScope(WaitContext& context, std::uint64_t id)
    : context_(&context), id_(id) {
}

WaitScope::~WaitScope() {
  context_->EndScope(id_);
}

auto WaitContext::AddScope(bool allow_cancellation, std::string description)
    -> WaitScope {
  auto id = next_scope_id_.fetch_add(1, std::memory_order_relaxed);
  BeginScope(id, allow_cancellation, std::move(description));
  return WaitScope(*this, id);
}

}  // namespace implnav
