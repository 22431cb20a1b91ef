#include "core/RateLimiter.h"

#include <algorithm>
#include <utility>

#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "ratelimit";
}  // namespace

RateLimiter::RateLimiter(uint16_t ratePerSecond) : RateLimiter(ratePerSecond, &platform::millisMs) {}

RateLimiter::RateLimiter(uint16_t ratePerSecond, Clock clock)
    : rate_(ratePerSecond == 0 ? 1 : ratePerSecond),
      clock_(std::move(clock)),
      tokens_(static_cast<double>(rate_)),
      lastRefillMs_(clock_()) {}

bool RateLimiter::allow() {
  platform::LockGuard lock(mutex_);
  if (!lock.locked()) {
    platform::logw(kTag, "lock unavailable; denying");
    return false;
  }
  const uint32_t nowMs = clock_();
  const uint32_t elapsedMs = nowMs - lastRefillMs_;
  lastRefillMs_ = nowMs;
  tokens_ = std::min(static_cast<double>(rate_),
                     tokens_ + static_cast<double>(elapsedMs) * rate_ / 1000.0);
  if (tokens_ >= 1.0) {
    tokens_ -= 1.0;
    return true;
  }
  return false;
}
