#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "core/Frame.h"
#include "core/NavigationState.h"
#include "platform/Sync.h"

class PanelRenderer {
 public:
  virtual ~PanelRenderer() = default;
  // False when the panel could not be drawn.
  virtual bool render(const NavSnapshot& nav, Frame& frame) = 0;
  // Drawn in place of a panel that failed; must keep navigation usable.
  virtual void renderFailure(const NavSnapshot& nav, Frame& frame) = 0;
};

class DisplaySink {
 public:
  virtual ~DisplaySink() = default;
  virtual bool write(const Frame& frame) = 0;
};

// Render loop: draw the active panel, push it to the display, publish it as
// the last frame, then wait for the panel's refresh interval or an earlier
// wake (navigation, on-demand render, stop). Only the thread running run()
// draws.
class RenderScheduler {
 public:
  RenderScheduler(NavigationState& nav, PanelRenderer& renderer, DisplaySink& sink,
                  platform::WakeSignal& wake, uint16_t width, uint16_t height);

  void run();
  void requestStop();
  bool stopRequested() const { return stop_.load(); }
  bool running() const { return running_.load(); }

  // One Rendering step. Public for tests and for the boot splash.
  bool renderOnce();

  std::shared_ptr<const Frame> lastFrame() const;
  // Asks the render thread for a fresh frame of the active panel and waits up
  // to timeoutMs. Falls back to the last frame (may be null).
  std::shared_ptr<const Frame> renderOnDemand(uint32_t timeoutMs);

  uint32_t renderCount() const { return renderCount_.load(); }
  uint32_t failureCount() const { return failureCount_.load(); }

 private:
  std::shared_ptr<Frame> takeBackBuffer();

  NavigationState& nav_;
  PanelRenderer& renderer_;
  DisplaySink& sink_;
  platform::WakeSignal& wake_;
  const uint16_t width_;
  const uint16_t height_;

  std::atomic<bool> stop_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> onDemandRequested_{false};
  std::atomic<uint32_t> renderCount_{0};
  std::atomic<uint32_t> failureCount_{0};
  platform::WakeSignal onDemandDone_;
  platform::Mutex onDemandGate_;

  mutable platform::Mutex frameMutex_;
  std::shared_ptr<Frame> front_;
  std::shared_ptr<Frame> back_;
};
