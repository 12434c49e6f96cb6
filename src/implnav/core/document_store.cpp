#include "implnav/core/document_store.hpp"

#include <mutex>

namespace implnav {

DocumentStore::DocumentStore(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto DocumentStore::Open(Document document) -> void {
  logger_->debug(
      "DocumentStore open: {} ({}, v{})", document.uri, document.language_id,
      document.version);
  std::unique_lock lock(mutex_);
  auto uri = document.uri;
  documents_.insert_or_assign(std::move(uri), std::move(document));
}

auto DocumentStore::Update(const std::string& uri, std::string text, int version)
    -> bool {
  std::unique_lock lock(mutex_);
  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    logger_->warn("DocumentStore update for unopened document: {}", uri);
    return false;
  }
  it->second.text = std::move(text);
  it->second.version = version;
  return true;
}

auto DocumentStore::Close(const std::string& uri) -> void {
  logger_->debug("DocumentStore close: {}", uri);
  std::unique_lock lock(mutex_);
  documents_.erase(uri);
}

auto DocumentStore::Get(const std::string& uri) const
    -> std::optional<Document> {
  std::shared_lock lock(mutex_);
  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto DocumentStore::IsOpen(const std::string& uri) const -> bool {
  std::shared_lock lock(mutex_);
  return documents_.contains(uri);
}

auto DocumentStore::Size() const -> size_t {
  std::shared_lock lock(mutex_);
  return documents_.size();
}

}  // namespace implnav
