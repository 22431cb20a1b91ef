#include "core/BootCommon.h"

#include "RuntimeSettings.h"
#include "platform/Platform.h"

namespace boot {
namespace {

constexpr char kTag[] = "baseline";

}  // namespace

void start(BaselineState& state, bool enabled) {
  state = BaselineState();
  state.enabled = enabled;
  state.bootStartMs = platform::millisMs();
  state.lastStageMs = state.bootStartMs;
}

void mark(BaselineState& state, const char* stage) {
  if (!state.enabled || stage == nullptr) {
    return;
  }
  const uint32_t nowMs = platform::millisMs();
  const platform::HeapStats heap = platform::heapStats();
  platform::logi(kTag, "stage=%s t_ms=%u dt_ms=%u heap_free=%u heap_largest=%u psram_free=%u",
                 stage, static_cast<unsigned>(nowMs - state.bootStartMs),
                 static_cast<unsigned>(nowMs - state.lastStageMs),
                 static_cast<unsigned>(heap.freeBytes),
                 static_cast<unsigned>(heap.largestBlockBytes),
                 static_cast<unsigned>(heap.psramFreeBytes));
  state.lastStageMs = nowMs;
}

bool markLoop(BaselineState& state, const LoopSnapshot& snapshot, uint32_t periodMs) {
  if (!state.enabled) {
    return false;
  }
  const uint32_t nowMs = platform::millisMs();
  if (state.lastLoopLogMs == 0) {
    state.lastLoopLogMs = nowMs;
    state.lastRenderCount = snapshot.renderCount;
    return false;
  }
  const uint32_t elapsedMs = nowMs - state.lastLoopLogMs;
  if (elapsedMs < periodMs) {
    return false;
  }
  const uint32_t frames = snapshot.renderCount - state.lastRenderCount;
  state.lastLoopLogMs = nowMs;
  state.lastRenderCount = snapshot.renderCount;

  const platform::HeapStats heap = platform::heapStats();
  platform::logi(kTag,
                 "uptime_s=%u panel=%s frames=%u render_fail=%u heap_free=%u heap_min=%u "
                 "heap_dma_largest=%u wifi=%d rssi=%d",
                 static_cast<unsigned>(nowMs / 1000U),
                 snapshot.panel == nullptr ? "-" : snapshot.panel, static_cast<unsigned>(frames),
                 static_cast<unsigned>(snapshot.renderFailures),
                 static_cast<unsigned>(heap.freeBytes), static_cast<unsigned>(heap.minFreeBytes),
                 static_cast<unsigned>(heap.largestDmaBlockBytes),
                 snapshot.wifiConnected ? 1 : 0, snapshot.wifiConnected ? snapshot.rssi : 0);
  return true;
}

void logSettingsSummary(const char* panelName) {
  static constexpr const char* kThemeNames[] = {"config", "auto", "day", "night"};
  const int theme = RuntimeSettings::themeMode;
  platform::logi("settings", "clock=%s theme=%s start_panel=%s",
                 RuntimeSettings::use24HourClock ? "24h" : "12h",
                 kThemeNames[(theme >= -1 && theme <= 2) ? theme + 1 : 0],
                 panelName == nullptr ? "-" : panelName);
}

}  // namespace boot
