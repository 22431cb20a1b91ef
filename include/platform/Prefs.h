#pragma once

#include <cstdint>
#include <string>

// Small persistent key/value store (NVS on the device).
namespace platform::prefs {

bool getBool(const char* ns, const char* key, bool defaultValue);
int32_t getInt(const char* ns, const char* key, int32_t defaultValue);
std::string getString(const char* ns, const char* key, const char* defaultValue = "");

bool putBool(const char* ns, const char* key, bool value);
bool putInt(const char* ns, const char* key, int32_t value);
bool putString(const char* ns, const char* key, const char* value);

}  // namespace platform::prefs
