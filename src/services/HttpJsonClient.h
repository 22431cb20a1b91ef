#pragma once

#include <ArduinoJson.h>

#include <cstdint>
#include <functional>
#include <string>

#include "platform/Http.h"

struct HttpFetchMeta {
  int statusCode = 0;
  size_t payloadBytes = 0;
  std::string transportReason;
  uint32_t elapsedMs = 0;
};

class HttpJsonClient {
 public:
  using Transport =
      std::function<bool(const std::string& url, uint32_t timeoutMs, platform::http::TextResponse& out)>;

  explicit HttpJsonClient(Transport transport, uint32_t timeoutMs = 10000);

  bool get(const std::string& url, JsonDocument& outDoc, std::string* errorMessage = nullptr,
           HttpFetchMeta* meta = nullptr) const;

 private:
  Transport transport_;
  uint32_t timeoutMs_;
};
