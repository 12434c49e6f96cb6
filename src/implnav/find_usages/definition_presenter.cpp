#include "implnav/find_usages/definition_presenter.hpp"

#include <exception>

namespace implnav {

PresenterProvider::PresenterProvider(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto PresenterProvider::AddFactory(Factory factory) -> void {
  std::lock_guard lock(mutex_);
  factories_.push_back(std::move(factory));
}

auto PresenterProvider::TryGetPresenter()
    -> std::optional<std::shared_ptr<DefinitionPresenter>> {
  std::lock_guard lock(mutex_);
  if (presenter_) {
    return presenter_;
  }
  if (factories_.empty()) {
    return std::nullopt;
  }

  try {
    auto presenter = factories_.front()();
    if (!presenter) {
      logger_->debug("PresenterProvider factory produced no presenter");
      return std::nullopt;
    }
    presenter_ = std::move(presenter);
    return presenter_;
  } catch (const std::exception& e) {
    logger_->warn("PresenterProvider failed to create presenter: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace implnav
