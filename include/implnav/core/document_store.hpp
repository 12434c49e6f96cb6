#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "implnav/core/document.hpp"

namespace implnav {

// Tracks documents the editor has open. Written from the protocol thread,
// read from command threads, so access is guarded by a shared mutex.
class DocumentStore {
 public:
  explicit DocumentStore(std::shared_ptr<spdlog::logger> logger = nullptr);

  auto Open(Document document) -> void;

  // Returns false if the document is not open
  auto Update(const std::string& uri, std::string text, int version) -> bool;

  auto Close(const std::string& uri) -> void;

  [[nodiscard]] auto Get(const std::string& uri) const
      -> std::optional<Document>;

  [[nodiscard]] auto IsOpen(const std::string& uri) const -> bool;

  [[nodiscard]] auto Size() const -> size_t;

 private:
  std::shared_ptr<spdlog::logger> logger_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Document> documents_;
};

}  // namespace implnav
