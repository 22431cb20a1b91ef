#include "platform/Prefs.h"

#include <map>
#include <mutex>

// Process-lifetime store; the host has no flash.
namespace {
std::mutex sMutex;
std::map<std::string, std::string> sValues;

std::string makeKey(const char* ns, const char* key) { return std::string(ns) + "/" + key; }

bool lookup(const char* ns, const char* key, std::string& out) {
  if (ns == nullptr || key == nullptr) {
    return false;
  }
  std::lock_guard<std::mutex> lock(sMutex);
  const auto it = sValues.find(makeKey(ns, key));
  if (it == sValues.end()) {
    return false;
  }
  out = it->second;
  return true;
}

bool store(const char* ns, const char* key, const std::string& value) {
  if (ns == nullptr || key == nullptr) {
    return false;
  }
  std::lock_guard<std::mutex> lock(sMutex);
  sValues[makeKey(ns, key)] = value;
  return true;
}
}  // namespace

namespace platform::prefs {

bool getBool(const char* ns, const char* key, bool defaultValue) {
  std::string raw;
  if (!lookup(ns, key, raw)) {
    return defaultValue;
  }
  return raw == "1";
}

int32_t getInt(const char* ns, const char* key, int32_t defaultValue) {
  std::string raw;
  if (!lookup(ns, key, raw)) {
    return defaultValue;
  }
  return static_cast<int32_t>(std::stol(raw));
}

std::string getString(const char* ns, const char* key, const char* defaultValue) {
  std::string raw;
  if (!lookup(ns, key, raw)) {
    return std::string(defaultValue == nullptr ? "" : defaultValue);
  }
  return raw;
}

bool putBool(const char* ns, const char* key, bool value) {
  return store(ns, key, value ? "1" : "0");
}

bool putInt(const char* ns, const char* key, int32_t value) {
  return store(ns, key, std::to_string(value));
}

bool putString(const char* ns, const char* key, const char* value) {
  if (value == nullptr) {
    return false;
  }
  return store(ns, key, value);
}

}  // namespace platform::prefs
