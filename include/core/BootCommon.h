#pragma once

#include <cstdint>

// Boot stage timing and periodic health lines ("baseline" tag). Everything is
// a no-op when disabled so call sites stay unconditional.
namespace boot {

struct BaselineState {
  bool enabled = false;
  uint32_t bootStartMs = 0;
  uint32_t lastStageMs = 0;
  uint32_t lastLoopLogMs = 0;
  uint32_t lastRenderCount = 0;
};

struct LoopSnapshot {
  bool wifiConnected = false;
  int rssi = 0;
  uint32_t renderCount = 0;
  uint32_t renderFailures = 0;
  const char* panel = nullptr;
};

void start(BaselineState& state, bool enabled);
void mark(BaselineState& state, const char* stage);
// Logs at most once per periodMs; returns true when a line was written.
bool markLoop(BaselineState& state, const LoopSnapshot& snapshot, uint32_t periodMs);
void logSettingsSummary(const char* panelName);

}  // namespace boot
