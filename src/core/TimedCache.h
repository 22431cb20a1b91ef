#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "platform/Platform.h"
#include "platform/Sync.h"

// TTL cache around a fetch that may take several network calls and may fail.
//
// The fetch writes into a staging value; value and timestamp are committed
// together only when the whole fetch succeeded, so a failed later step never
// leaves a half-updated entry or resets the refresh clock. On failure callers
// keep getting the last good value (possibly stale) or std::nullopt.
//
// The fetch runs outside the lock. While one caller is fetching, other
// callers get the current entry instead of starting a second fetch.
template <typename T>
class TimedCache {
 public:
  using Fetcher = std::function<bool(T& out)>;
  using Clock = std::function<uint32_t()>;

  struct Entry {
    std::optional<T> value;
    uint32_t lastUpdatedMs = 0;
  };

  TimedCache(std::string name, uint32_t ttlMs, Fetcher fetcher,
             Clock clock = &platform::millisMs)
      : name_(std::move(name)),
        ttlMs_(ttlMs),
        fetcher_(std::move(fetcher)),
        clock_(std::move(clock)) {}

  TimedCache(const TimedCache&) = delete;
  TimedCache& operator=(const TimedCache&) = delete;

  std::optional<T> get() {
    {
      platform::LockGuard lock(mutex_);
      if (isFreshLocked(clock_())) {
        return entry_.value;
      }
      if (fetchInFlight_) {
        return entry_.value;
      }
      fetchInFlight_ = true;
    }

    T staged{};
    const uint32_t startMs = clock_();
    const bool ok = fetcher_ ? fetcher_(staged) : false;

    platform::LockGuard lock(mutex_);
    fetchInFlight_ = false;
    ++fetchAttempts_;
    if (ok) {
      entry_.value = std::move(staged);
      entry_.lastUpdatedMs = clock_();
      platform::logi(kTag, "name=%s refreshed elapsed_ms=%u", name_.c_str(),
                     static_cast<unsigned>(entry_.lastUpdatedMs - startMs));
    } else {
      platform::logw(kTag, "name=%s fetch failed; keeping %s", name_.c_str(),
                     entry_.value ? "stale value" : "nothing");
    }
    return entry_.value;
  }

  // Never fetches. Used by the render path, which must not block on I/O.
  std::optional<T> peek() const {
    platform::LockGuard lock(mutex_);
    return entry_.value;
  }

  Entry entry() const {
    platform::LockGuard lock(mutex_);
    return entry_;
  }

  bool isFresh() const {
    platform::LockGuard lock(mutex_);
    return isFreshLocked(clock_());
  }

  uint32_t fetchAttempts() const {
    platform::LockGuard lock(mutex_);
    return fetchAttempts_;
  }

  const std::string& name() const { return name_; }
  uint32_t ttlMs() const { return ttlMs_; }

 private:
  static constexpr const char* kTag = "cache";

  bool isFreshLocked(uint32_t nowMs) const {
    return entry_.value.has_value() && (nowMs - entry_.lastUpdatedMs) < ttlMs_;
  }

  const std::string name_;
  const uint32_t ttlMs_;
  Fetcher fetcher_;
  Clock clock_;
  mutable platform::Mutex mutex_;
  Entry entry_;
  bool fetchInFlight_ = false;
  uint32_t fetchAttempts_ = 0;
};
