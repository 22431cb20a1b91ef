#include "platform/Sync.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace platform {

struct MutexImpl {
  std::timed_mutex mutex;
};

struct WakeSignalImpl {
  std::mutex mutex;
  std::condition_variable cv;
  bool pending = false;
};

Mutex::Mutex() : impl_(std::make_unique<MutexImpl>()) {}

Mutex::~Mutex() = default;

bool Mutex::lock(uint32_t timeoutMs) {
  if (timeoutMs == kWaitForever) {
    impl_->mutex.lock();
    return true;
  }
  return impl_->mutex.try_lock_for(std::chrono::milliseconds(timeoutMs));
}

void Mutex::unlock() { impl_->mutex.unlock(); }

WakeSignal::WakeSignal() : impl_(std::make_unique<WakeSignalImpl>()) {}

WakeSignal::~WakeSignal() = default;

void WakeSignal::notify() {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->pending = true;
  }
  impl_->cv.notify_all();
}

bool WakeSignal::wait(uint32_t timeoutMs) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  const auto isPending = [this] { return impl_->pending; };
  if (timeoutMs == kWaitForever) {
    impl_->cv.wait(lock, isPending);
  } else if (!impl_->cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), isPending)) {
    return false;
  }
  impl_->pending = false;
  return true;
}

void WakeSignal::clear() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->pending = false;
}

}  // namespace platform
