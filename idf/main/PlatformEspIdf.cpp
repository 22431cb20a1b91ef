#include "platform/Platform.h"

#include <cstdarg>
#include <cstdio>
#include <new>

#include "esp_heap_caps.h"
#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

namespace platform {
namespace {

constexpr char kDefaultTag[] = "sunpanel";

esp_log_level_t toEspLevel(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return ESP_LOG_DEBUG;
    case LogLevel::kInfo:
      return ESP_LOG_INFO;
    case LogLevel::kWarn:
      return ESP_LOG_WARN;
    case LogLevel::kError:
      return ESP_LOG_ERROR;
    case LogLevel::kNone:
      break;
  }
  return ESP_LOG_NONE;
}

// Formats once on the stack; long lines (JSON error bodies) fall back to the
// heap so they are not cut.
void vlog(LogLevel level, const char* tag, const char* fmt, va_list args) {
  if (fmt == nullptr) {
    return;
  }
  const char* resolvedTag = (tag == nullptr || *tag == '\0') ? kDefaultTag : tag;
  const esp_log_level_t espLevel = toEspLevel(level);
  if (espLevel == ESP_LOG_NONE) {
    return;
  }

  char buffer[256];
  va_list copy;
  va_copy(copy, args);
  const int n = std::vsnprintf(buffer, sizeof(buffer), fmt, copy);
  va_end(copy);
  if (n <= 0) {
    return;
  }
  if (n < static_cast<int>(sizeof(buffer))) {
    ESP_LOG_LEVEL(espLevel, resolvedTag, "%s", buffer);
    return;
  }

  char* longLine = new (std::nothrow) char[static_cast<size_t>(n) + 1U];
  if (longLine == nullptr) {
    ESP_LOG_LEVEL(espLevel, resolvedTag, "%s (truncated)", buffer);
    return;
  }
  std::vsnprintf(longLine, static_cast<size_t>(n) + 1U, fmt, args);
  ESP_LOG_LEVEL(espLevel, resolvedTag, "%s", longLine);
  delete[] longLine;
}

}  // namespace

uint32_t millisMs() { return static_cast<uint32_t>(esp_timer_get_time() / 1000ULL); }

void sleepMs(uint32_t ms) { vTaskDelay(pdMS_TO_TICKS(ms)); }

void setLogLevel(const char* tag, LogLevel level) {
  const char* resolved = (tag == nullptr || *tag == '\0') ? "*" : tag;
  esp_log_level_set(resolved, toEspLevel(level));
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

HeapStats heapStats() {
  HeapStats stats;
  stats.freeBytes = static_cast<uint32_t>(heap_caps_get_free_size(MALLOC_CAP_8BIT));
  stats.minFreeBytes = static_cast<uint32_t>(heap_caps_get_minimum_free_size(MALLOC_CAP_8BIT));
  stats.largestBlockBytes =
      static_cast<uint32_t>(heap_caps_get_largest_free_block(MALLOC_CAP_8BIT));
  stats.largestDmaBlockBytes =
      static_cast<uint32_t>(heap_caps_get_largest_free_block(MALLOC_CAP_DMA));
  stats.psramFreeBytes = static_cast<uint32_t>(heap_caps_get_free_size(MALLOC_CAP_SPIRAM));
  return stats;
}

}  // namespace platform
