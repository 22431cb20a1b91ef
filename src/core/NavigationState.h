#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/PanelId.h"
#include "platform/Sync.h"

struct NavSnapshot {
  size_t index = 0;
  size_t count = 0;
  PanelId panel = PanelId::kClock;
  // Bumped on every mutation; lets the renderer tell "new panel" from "tick".
  uint32_t generation = 0;
};

// Single owner of "which panel is active". Mutated by the touch task and the
// control plane, read by the render task.
class NavigationState {
 public:
  NavigationState(std::vector<PanelId> panels, size_t initialIndex, platform::WakeSignal& wake);

  NavSnapshot next();
  NavSnapshot prev();
  NavSnapshot snapshot() const;
  size_t index() const;
  size_t count() const { return panels_.size(); }
  PanelId current() const;
  // Wakes the renderer without changing the panel (theme switch, etc).
  void wake();

 private:
  NavSnapshot step(int delta);
  NavSnapshot snapshotLocked() const;

  const std::vector<PanelId> panels_;
  mutable platform::Mutex mutex_;
  size_t index_ = 0;
  uint32_t generation_ = 0;
  platform::WakeSignal& wake_;
};
