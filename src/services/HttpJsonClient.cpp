#include "services/HttpJsonClient.h"

#include <utility>

#include "platform/Platform.h"
#include "services/HttpTransportGate.h"

namespace {
constexpr const char* kTag = "http";
constexpr uint32_t kGateTimeoutMs = 7000U;
constexpr uint32_t kTransportOutageCooldownMs = 12000U;
constexpr uint8_t kTransportOutageThreshold = 6U;

std::string extractLikelyJson(const std::string& payload) {
  const size_t start = payload.find_first_of("{[");
  if (start == std::string::npos) {
    return payload;
  }
  const size_t end = payload.find_last_of("}]");
  if (end == std::string::npos || end < start) {
    return payload.substr(start);
  }
  return payload.substr(start, end - start + 1);
}

std::string compactPreview(const std::string& payload, size_t maxLen = 120) {
  std::string out;
  out.reserve(std::min(payload.size(), maxLen));
  for (char c : payload) {
    out.push_back((c == '\n' || c == '\r') ? ' ' : c);
    if (out.size() >= maxLen) {
      out += "...";
      break;
    }
  }
  return out;
}

std::string trimmed(const std::string& s) {
  const char* ws = " \t\r\n";
  const size_t start = s.find_first_not_of(ws);
  if (start == std::string::npos) {
    return std::string();
  }
  const size_t end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

uint8_t sTransportFailureStreak = 0;
uint32_t sTransportOutageUntilMs = 0;
bool sOutageActive = false;

void noteTransportFailure(const std::string& reason) {
  if (sTransportFailureStreak < 255) {
    ++sTransportFailureStreak;
  }
  if (sTransportFailureStreak >= kTransportOutageThreshold) {
    sTransportOutageUntilMs = platform::millisMs() + kTransportOutageCooldownMs;
    sOutageActive = true;
  }
  platform::logw(kTag, "transport fail streak=%u reason='%s'",
                 static_cast<unsigned>(sTransportFailureStreak), reason.c_str());
}

void noteSuccessfulHttpResponse() {
  sTransportFailureStreak = 0;
  sOutageActive = false;
}

bool inTransportOutageCooldown(std::string* errorMessage, HttpFetchMeta* meta) {
  if (!sOutageActive) {
    return false;
  }
  const uint32_t nowMs = platform::millisMs();
  if (static_cast<int32_t>(nowMs - sTransportOutageUntilMs) >= 0) {
    sOutageActive = false;
    return false;
  }
  if (meta != nullptr) {
    meta->statusCode = -3;
    meta->transportReason = "transport-cooldown";
  }
  if (errorMessage != nullptr) {
    *errorMessage = "Transport cooldown active (" +
                    std::to_string(sTransportOutageUntilMs - nowMs) + " ms remaining)";
  }
  return true;
}

}  // namespace

HttpJsonClient::HttpJsonClient(Transport transport, uint32_t timeoutMs)
    : transport_(std::move(transport)), timeoutMs_(timeoutMs) {}

bool HttpJsonClient::get(const std::string& url, JsonDocument& outDoc, std::string* errorMessage,
                         HttpFetchMeta* meta) const {
  if (meta != nullptr) {
    *meta = HttpFetchMeta();
  }
  const uint32_t startMs = platform::millisMs();
  if (inTransportOutageCooldown(errorMessage, meta)) {
    return false;
  }
  if (!transport_) {
    if (errorMessage != nullptr) {
      *errorMessage = "No HTTP transport";
    }
    return false;
  }

  platform::http::TextResponse resp;
  {
    httpgate::Guard guard(kGateTimeoutMs);
    if (!guard.locked()) {
      if (errorMessage != nullptr) {
        *errorMessage = "HTTP busy (transport gate timeout)";
      }
      return false;
    }
    if (!transport_(url, timeoutMs_, resp)) {
      const std::string reason = resp.reason.empty() ? "no-http-status" : resp.reason;
      noteTransportFailure(reason);
      if (meta != nullptr) {
        meta->statusCode = resp.statusCode > 0 ? resp.statusCode : -1;
        meta->transportReason = reason;
        meta->elapsedMs = platform::millisMs() - startMs;
      }
      if (errorMessage != nullptr) {
        *errorMessage = "HTTP transport failure reason='" + reason + "'";
      }
      return false;
    }
  }
  noteSuccessfulHttpResponse();

  if (meta != nullptr) {
    meta->statusCode = resp.statusCode;
    meta->payloadBytes = resp.body.size();
    meta->elapsedMs = platform::millisMs() - startMs;
  }

  if (resp.statusCode < 200 || resp.statusCode >= 300) {
    if (errorMessage != nullptr) {
      *errorMessage = "HTTP status " + std::to_string(resp.statusCode) + ", preview='" +
                      compactPreview(resp.body) + "'";
    }
    return false;
  }

  std::string payload = trimmed(resp.body);
  if (payload.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    payload.erase(0, 3);
  }
  if (payload.empty()) {
    if (errorMessage != nullptr) {
      *errorMessage = "Empty payload (status=" + std::to_string(resp.statusCode) + ")";
    }
    return false;
  }

  const DeserializationError err = deserializeJson(outDoc, extractLikelyJson(payload));
  if (err) {
    if (errorMessage != nullptr) {
      *errorMessage = std::string("JSON parse failed (") + err.c_str() +
                      "), bytes=" + std::to_string(payload.size()) + ", preview='" +
                      compactPreview(payload) + "'";
    }
    return false;
  }
  return true;
}
