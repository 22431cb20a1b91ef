#pragma once

#include <cstdint>
#include <memory>

namespace platform {

constexpr uint32_t kWaitForever = 0xFFFFFFFFU;

struct MutexImpl;
struct WakeSignalImpl;

class Mutex {
 public:
  Mutex();
  ~Mutex();
  Mutex(const Mutex&) = delete;
  Mutex& operator=(const Mutex&) = delete;

  bool lock(uint32_t timeoutMs = kWaitForever);
  void unlock();

 private:
  std::unique_ptr<MutexImpl> impl_;
};

class LockGuard {
 public:
  explicit LockGuard(Mutex& mutex, uint32_t timeoutMs = kWaitForever)
      : mutex_(mutex), locked_(mutex.lock(timeoutMs)) {}
  ~LockGuard() {
    if (locked_) {
      mutex_.unlock();
    }
  }
  LockGuard(const LockGuard&) = delete;
  LockGuard& operator=(const LockGuard&) = delete;

  bool locked() const { return locked_; }

 private:
  Mutex& mutex_;
  bool locked_ = false;
};

// Latched wake notification. A notify() that happens while nobody waits is
// kept until the next wait() or clear(), so it can never be lost.
class WakeSignal {
 public:
  WakeSignal();
  ~WakeSignal();
  WakeSignal(const WakeSignal&) = delete;
  WakeSignal& operator=(const WakeSignal&) = delete;

  void notify();
  // True when woken by notify(), false on timeout. Consumes the latch.
  bool wait(uint32_t timeoutMs);
  void clear();

 private:
  std::unique_ptr<WakeSignalImpl> impl_;
};

}  // namespace platform
