#pragma once

#include <cstdint>
#include <functional>

#include "platform/Sync.h"

// Token bucket: holds at most `rate` tokens, refills at `rate` tokens per
// second, each allowed request takes one.
class RateLimiter {
 public:
  using Clock = std::function<uint32_t()>;

  explicit RateLimiter(uint16_t ratePerSecond);
  RateLimiter(uint16_t ratePerSecond, Clock clock);

  bool allow();
  uint16_t rate() const { return rate_; }

 private:
  const uint16_t rate_;
  Clock clock_;
  platform::Mutex mutex_;
  double tokens_;
  uint32_t lastRefillMs_;
};
