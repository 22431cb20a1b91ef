#include "platform/Sync.h"

#include <memory>

#include "esp_err.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"

namespace {
constexpr const char* kTag = "sync";

TickType_t toTicks(uint32_t timeoutMs) {
  if (timeoutMs == platform::kWaitForever) {
    return portMAX_DELAY;
  }
  return pdMS_TO_TICKS(timeoutMs);
}
}  // namespace

namespace platform {

struct MutexImpl {
  SemaphoreHandle_t handle = nullptr;
};

struct WakeSignalImpl {
  SemaphoreHandle_t handle = nullptr;
};

// Callers lock with kWaitForever and rely on it succeeding, so a mutex that
// cannot be created stops boot here.
Mutex::Mutex() : impl_(std::make_unique<MutexImpl>()) {
  impl_->handle = xSemaphoreCreateMutex();
  if (impl_->handle == nullptr) {
    ESP_LOGE(kTag, "mutex alloc failed");
    ESP_ERROR_CHECK(ESP_ERR_NO_MEM);
  }
}

Mutex::~Mutex() {
  if (impl_->handle != nullptr) {
    vSemaphoreDelete(impl_->handle);
    impl_->handle = nullptr;
  }
}

bool Mutex::lock(uint32_t timeoutMs) {
  if (impl_->handle == nullptr) {
    return false;
  }
  return xSemaphoreTake(impl_->handle, toTicks(timeoutMs)) == pdTRUE;
}

void Mutex::unlock() {
  if (impl_->handle != nullptr) {
    (void)xSemaphoreGive(impl_->handle);
  }
}

// A binary semaphore is the latch: give() while full is a no-op, take()
// empties it.
WakeSignal::WakeSignal() : impl_(std::make_unique<WakeSignalImpl>()) {
  impl_->handle = xSemaphoreCreateBinary();
  if (impl_->handle == nullptr) {
    ESP_LOGE(kTag, "wake signal alloc failed");
    ESP_ERROR_CHECK(ESP_ERR_NO_MEM);
  }
}

WakeSignal::~WakeSignal() {
  if (impl_->handle != nullptr) {
    vSemaphoreDelete(impl_->handle);
    impl_->handle = nullptr;
  }
}

void WakeSignal::notify() {
  if (impl_->handle != nullptr) {
    (void)xSemaphoreGive(impl_->handle);
  }
}

bool WakeSignal::wait(uint32_t timeoutMs) {
  if (impl_->handle == nullptr) {
    vTaskDelay(toTicks(timeoutMs == kWaitForever ? 1000U : timeoutMs));
    return false;
  }
  return xSemaphoreTake(impl_->handle, toTicks(timeoutMs)) == pdTRUE;
}

void WakeSignal::clear() {
  if (impl_->handle != nullptr) {
    (void)xSemaphoreTake(impl_->handle, 0);
  }
}

}  // namespace platform
