#pragma once

#include <cstdint>

namespace platform {

enum class LogLevel : uint8_t { kDebug = 0, kInfo, kWarn, kError, kNone };

uint32_t millisMs();
void sleepMs(uint32_t ms);

// Per-tag threshold; a null or "*" tag sets the default for all tags.
void setLogLevel(const char* tag, LogLevel level);

void logd(const char* tag, const char* fmt, ...);
void logi(const char* tag, const char* fmt, ...);
void logw(const char* tag, const char* fmt, ...);
void loge(const char* tag, const char* fmt, ...);

struct HeapStats {
  uint32_t freeBytes = 0;
  uint32_t minFreeBytes = 0;
  uint32_t largestBlockBytes = 0;
  uint32_t largestDmaBlockBytes = 0;
  // Zero on boards without PSRAM.
  uint32_t psramFreeBytes = 0;
};

HeapStats heapStats();

}  // namespace platform
