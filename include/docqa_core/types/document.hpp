#pragma once

#include <string>

namespace docqa_core {

// A raw document as received from an upload or a download. Only lives until
// its text has been extracted.
struct Document {
  std::string source;  // file name or URL
  std::string bytes;
};

}  // namespace docqa_core
