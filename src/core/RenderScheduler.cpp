#include "core/RenderScheduler.h"

#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "render";
}  // namespace

RenderScheduler::RenderScheduler(NavigationState& nav, PanelRenderer& renderer, DisplaySink& sink,
                                 platform::WakeSignal& wake, uint16_t width, uint16_t height)
    : nav_(nav), renderer_(renderer), sink_(sink), wake_(wake), width_(width), height_(height) {}

void RenderScheduler::run() {
  running_ = true;
  platform::logi(kTag, "loop start %ux%u", static_cast<unsigned>(width_),
                 static_cast<unsigned>(height_));
  while (!stop_.load()) {
    (void)renderOnce();
    if (onDemandRequested_.exchange(false)) {
      onDemandDone_.notify();
    }
    if (stop_.load()) {
      break;
    }
    const uint32_t intervalMs = panelRefreshIntervalMs(nav_.current());
    (void)wake_.wait(intervalMs);
  }
  running_ = false;
  // Release anyone still waiting for an on-demand frame.
  onDemandDone_.notify();
  platform::logi(kTag, "loop stopped renders=%u failures=%u",
                 static_cast<unsigned>(renderCount_.load()),
                 static_cast<unsigned>(failureCount_.load()));
}

void RenderScheduler::requestStop() {
  stop_ = true;
  wake_.notify();
}

std::shared_ptr<Frame> RenderScheduler::takeBackBuffer() {
  platform::LockGuard lock(frameMutex_);
  // A screenshot may still hold the old front buffer; never draw into a
  // buffer someone else can see.
  if (back_ == nullptr || back_.use_count() > 1) {
    back_ = std::make_shared<Frame>(width_, height_);
  }
  return back_;
}

bool RenderScheduler::renderOnce() {
  const NavSnapshot snap = nav_.snapshot();
  std::shared_ptr<Frame> frame = takeBackBuffer();

  platform::logd(kTag, "render panel=%s gen=%u", panelName(snap.panel),
                 static_cast<unsigned>(snap.generation));
  bool ok = renderer_.render(snap, *frame);
  if (!ok) {
    ++failureCount_;
    platform::logw(kTag, "panel=%s render failed; drawing fallback", panelName(snap.panel));
    renderer_.renderFailure(snap, *frame);
  }
  if (!sink_.write(*frame)) {
    platform::logw(kTag, "display write failed panel=%s", panelName(snap.panel));
  }

  {
    platform::LockGuard lock(frameMutex_);
    back_.swap(front_);
  }
  ++renderCount_;
  return ok;
}

std::shared_ptr<const Frame> RenderScheduler::lastFrame() const {
  platform::LockGuard lock(frameMutex_);
  return front_;
}

std::shared_ptr<const Frame> RenderScheduler::renderOnDemand(uint32_t timeoutMs) {
  if (!running_.load() || stop_.load()) {
    return lastFrame();
  }
  platform::LockGuard gate(onDemandGate_, timeoutMs);
  if (!gate.locked()) {
    return lastFrame();
  }
  onDemandDone_.clear();
  onDemandRequested_ = true;
  wake_.notify();
  if (!onDemandDone_.wait(timeoutMs)) {
    platform::logw(kTag, "on-demand render timed out after %u ms", static_cast<unsigned>(timeoutMs));
  }
  return lastFrame();
}
