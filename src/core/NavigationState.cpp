#include "core/NavigationState.h"

#include <utility>

#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "nav";

std::vector<PanelId> nonEmpty(std::vector<PanelId> panels) {
  if (panels.empty()) {
    platform::logw(kTag, "empty panel list; using default order");
    return defaultPanelOrder();
  }
  return panels;
}
}  // namespace

NavigationState::NavigationState(std::vector<PanelId> panels, size_t initialIndex,
                                 platform::WakeSignal& wake)
    : panels_(nonEmpty(std::move(panels))), wake_(wake) {
  index_ = initialIndex < panels_.size() ? initialIndex : 0;
}

NavSnapshot NavigationState::next() { return step(1); }

NavSnapshot NavigationState::prev() { return step(-1); }

NavSnapshot NavigationState::step(int delta) {
  NavSnapshot snap;
  {
    platform::LockGuard lock(mutex_);
    const size_t n = panels_.size();
    index_ = delta > 0 ? (index_ + 1) % n : (index_ + n - 1) % n;
    ++generation_;
    snap = snapshotLocked();
  }
  wake_.notify();
  platform::logi(kTag, "panel=%s pos=%u/%u gen=%u", panelName(snap.panel),
                 static_cast<unsigned>(snap.index + 1), static_cast<unsigned>(snap.count),
                 static_cast<unsigned>(snap.generation));
  return snap;
}

NavSnapshot NavigationState::snapshot() const {
  platform::LockGuard lock(mutex_);
  return snapshotLocked();
}

NavSnapshot NavigationState::snapshotLocked() const {
  NavSnapshot snap;
  snap.index = index_;
  snap.count = panels_.size();
  snap.panel = panels_[index_];
  snap.generation = generation_;
  return snap;
}

size_t NavigationState::index() const {
  platform::LockGuard lock(mutex_);
  return index_;
}

PanelId NavigationState::current() const {
  platform::LockGuard lock(mutex_);
  return panels_[index_];
}

void NavigationState::wake() { wake_.notify(); }
