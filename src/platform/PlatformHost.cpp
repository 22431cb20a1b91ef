#include "platform/Platform.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace platform {
namespace {

std::mutex sLogMutex;
LogLevel sDefaultLevel = LogLevel::kInfo;
std::map<std::string, LogLevel> sTagLevels;

char levelLetter(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return 'D';
    case LogLevel::kInfo:
      return 'I';
    case LogLevel::kWarn:
      return 'W';
    case LogLevel::kError:
      return 'E';
    case LogLevel::kNone:
      break;
  }
  return '?';
}

// Same "L (ms) tag: message" shape as the ESP-IDF console.
void vlog(LogLevel level, const char* tag, const char* fmt, va_list args) {
  if (fmt == nullptr) {
    return;
  }
  const char* resolvedTag = (tag == nullptr || *tag == '\0') ? "sunpanel" : tag;
  std::lock_guard<std::mutex> lock(sLogMutex);
  const auto it = sTagLevels.find(resolvedTag);
  const LogLevel threshold = it != sTagLevels.end() ? it->second : sDefaultLevel;
  if (threshold == LogLevel::kNone || level < threshold) {
    return;
  }
  char buffer[512];
  const int n = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
  if (n <= 0) {
    return;
  }
  std::fprintf(stderr, "%c (%u) %s: %s\n", levelLetter(level),
               static_cast<unsigned>(millisMs()), resolvedTag, buffer);
}

}  // namespace

uint32_t millisMs() {
  static const auto sStart = std::chrono::steady_clock::now();
  const auto elapsed = std::chrono::steady_clock::now() - sStart;
  return static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void sleepMs(uint32_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

void setLogLevel(const char* tag, LogLevel level) {
  std::lock_guard<std::mutex> lock(sLogMutex);
  if (tag == nullptr || *tag == '\0' || std::string(tag) == "*") {
    sDefaultLevel = level;
    sTagLevels.clear();
    return;
  }
  sTagLevels[tag] = level;
}

#define SUNPANEL_DEFINE_LOG(name, level)                  \
  void name(const char* tag, const char* fmt, ...) {      \
    va_list args;                                         \
    va_start(args, fmt);                                  \
    vlog(level, tag, fmt, args);                          \
    va_end(args);                                         \
  }

SUNPANEL_DEFINE_LOG(logd, LogLevel::kDebug)
SUNPANEL_DEFINE_LOG(logi, LogLevel::kInfo)
SUNPANEL_DEFINE_LOG(logw, LogLevel::kWarn)
SUNPANEL_DEFINE_LOG(loge, LogLevel::kError)

#undef SUNPANEL_DEFINE_LOG

// The host has no meaningful heap figures.
HeapStats heapStats() { return HeapStats(); }

}  // namespace platform
