#pragma once

#include <string>

namespace implnav {

// Snapshot of an open document as the editor last reported it
struct Document {
  std::string uri;
  std::string language_id;
  int version = 0;
  std::string text;
};

}  // namespace implnav
