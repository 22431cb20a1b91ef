#include "platform/Prefs.h"

#include "nvs.h"

namespace {

class NvsHandle {
 public:
  NvsHandle(const char* ns, nvs_open_mode_t mode) {
    if (ns != nullptr) {
      open_ = nvs_open(ns, mode, &handle_) == ESP_OK;
    }
  }
  ~NvsHandle() {
    if (open_) {
      nvs_close(handle_);
    }
  }
  NvsHandle(const NvsHandle&) = delete;
  NvsHandle& operator=(const NvsHandle&) = delete;

  bool isOpen() const { return open_; }
  nvs_handle_t get() const { return handle_; }
  bool commit() { return open_ && nvs_commit(handle_) == ESP_OK; }

 private:
  nvs_handle_t handle_ = 0;
  bool open_ = false;
};

// Missing keys are not an error; anything else falls back to the default.
bool readOk(esp_err_t err) { return err == ESP_OK || err == ESP_ERR_NVS_NOT_FOUND; }

}  // namespace

namespace platform::prefs {

bool getBool(const char* ns, const char* key, bool defaultValue) {
  NvsHandle nvs(ns, NVS_READONLY);
  if (key == nullptr || !nvs.isOpen()) {
    return defaultValue;
  }
  uint8_t raw = defaultValue ? 1U : 0U;
  if (!readOk(nvs_get_u8(nvs.get(), key, &raw))) {
    return defaultValue;
  }
  return raw != 0U;
}

int32_t getInt(const char* ns, const char* key, int32_t defaultValue) {
  NvsHandle nvs(ns, NVS_READONLY);
  if (key == nullptr || !nvs.isOpen()) {
    return defaultValue;
  }
  int32_t value = defaultValue;
  if (!readOk(nvs_get_i32(nvs.get(), key, &value))) {
    return defaultValue;
  }
  return value;
}

std::string getString(const char* ns, const char* key, const char* defaultValue) {
  const std::string fallback(defaultValue == nullptr ? "" : defaultValue);
  NvsHandle nvs(ns, NVS_READONLY);
  if (key == nullptr || !nvs.isOpen()) {
    return fallback;
  }
  size_t size = 0;
  if (nvs_get_str(nvs.get(), key, nullptr, &size) != ESP_OK || size == 0) {
    return fallback;
  }
  std::string value(size, '\0');
  if (nvs_get_str(nvs.get(), key, value.data(), &size) != ESP_OK) {
    return fallback;
  }
  if (!value.empty() && value.back() == '\0') {
    value.pop_back();
  }
  return value;
}

bool putBool(const char* ns, const char* key, bool value) {
  NvsHandle nvs(ns, NVS_READWRITE);
  if (key == nullptr || !nvs.isOpen()) {
    return false;
  }
  if (nvs_set_u8(nvs.get(), key, value ? 1U : 0U) != ESP_OK) {
    return false;
  }
  return nvs.commit();
}

bool putInt(const char* ns, const char* key, int32_t value) {
  NvsHandle nvs(ns, NVS_READWRITE);
  if (key == nullptr || !nvs.isOpen()) {
    return false;
  }
  if (nvs_set_i32(nvs.get(), key, value) != ESP_OK) {
    return false;
  }
  return nvs.commit();
}

bool putString(const char* ns, const char* key, const char* value) {
  NvsHandle nvs(ns, NVS_READWRITE);
  if (key == nullptr || value == nullptr || !nvs.isOpen()) {
    return false;
  }
  if (nvs_set_str(nvs.get(), key, value) != ESP_OK) {
    return false;
  }
  return nvs.commit();
}

}  // namespace platform::prefs
