#pragma once

#include <cstdint>
#include <string>

namespace platform::http {

struct TextResponse {
  int statusCode = 0;
  std::string body;
  std::string reason;
};

// Blocking GET. Returns true when a complete response (any status) was read.
bool getText(const char* url, uint32_t timeoutMs, TextResponse& out);

}  // namespace platform::http
