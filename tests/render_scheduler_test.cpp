#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "core/RenderScheduler.h"
#include "platform/Platform.h"

namespace {

class RecordingRenderer : public PanelRenderer {
 public:
  bool render(const NavSnapshot& nav, Frame& frame) override {
    const uint32_t n = ++calls;
    lastPanel = nav.panel;
    frame.fill(static_cast<uint16_t>(n));
    return !failNext.exchange(false);
  }

  void renderFailure(const NavSnapshot& nav, Frame& frame) override {
    (void)nav;
    ++failures;
    frame.fill(0xF800);
  }

  std::atomic<uint32_t> calls{0};
  std::atomic<uint32_t> failures{0};
  std::atomic<bool> failNext{false};
  std::atomic<PanelId> lastPanel{PanelId::kClock};
};

class CountingSink : public DisplaySink {
 public:
  bool write(const Frame& frame) override {
    ++writes;
    lastColor = frame.pixel(0, 0);
    return true;
  }

  std::atomic<uint32_t> writes{0};
  std::atomic<uint16_t> lastColor{0};
};

template <typename Pred>
bool waitFor(Pred pred, uint32_t timeoutMs = 2000) {
  const uint32_t start = platform::millisMs();
  while (!pred()) {
    if (platform::millisMs() - start > timeoutMs) {
      return false;
    }
    platform::sleepMs(2);
  }
  return true;
}

class RenderSchedulerTest : public ::testing::Test {
 protected:
  explicit RenderSchedulerTest(size_t initialIndex = 0)
      : nav_(defaultPanelOrder(), initialIndex, wake_),
        scheduler_(nav_, renderer_, sink_, wake_, 16, 8) {}

  ~RenderSchedulerTest() override {
    scheduler_.requestStop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  void startLoop() {
    thread_ = std::thread([this] { scheduler_.run(); });
    ASSERT_TRUE(waitFor([this] { return scheduler_.running() && scheduler_.renderCount() >= 1; }));
  }

  platform::WakeSignal wake_;
  NavigationState nav_;
  RecordingRenderer renderer_;
  CountingSink sink_;
  RenderScheduler scheduler_;
  std::thread thread_;
};

// Starts on the day-length panel, which only refreshes hourly.
class RenderSchedulerSlowPanelTest : public RenderSchedulerTest {
 protected:
  RenderSchedulerSlowPanelTest() : RenderSchedulerTest(4) {}
};

}  // namespace

TEST_F(RenderSchedulerTest, RenderOnceDrawsWritesAndPublishes) {
  EXPECT_EQ(scheduler_.lastFrame(), nullptr);
  EXPECT_TRUE(scheduler_.renderOnce());
  EXPECT_EQ(renderer_.calls.load(), 1u);
  EXPECT_EQ(sink_.writes.load(), 1u);
  const auto frame = scheduler_.lastFrame();
  ASSERT_NE(frame, nullptr);
  EXPECT_EQ(frame->width(), 16);
  EXPECT_EQ(frame->height(), 8);
  EXPECT_EQ(frame->pixel(0, 0), 1);
  EXPECT_EQ(scheduler_.renderCount(), 1u);
}

TEST_F(RenderSchedulerTest, FailedPanelIsReplacedByFallback) {
  renderer_.failNext = true;
  EXPECT_FALSE(scheduler_.renderOnce());
  EXPECT_EQ(renderer_.failures.load(), 1u);
  EXPECT_EQ(scheduler_.failureCount(), 1u);
  EXPECT_EQ(sink_.writes.load(), 1u);
  EXPECT_EQ(sink_.lastColor.load(), 0xF800);

  // The loop keeps going after a failure.
  EXPECT_TRUE(scheduler_.renderOnce());
  EXPECT_EQ(scheduler_.failureCount(), 1u);
}

TEST_F(RenderSchedulerTest, HeldFrameIsNeverDrawnInto) {
  ASSERT_TRUE(scheduler_.renderOnce());
  const auto held = scheduler_.lastFrame();
  ASSERT_TRUE(scheduler_.renderOnce());
  ASSERT_TRUE(scheduler_.renderOnce());
  EXPECT_EQ(held->pixel(0, 0), 1);
  EXPECT_NE(scheduler_.lastFrame(), held);
  EXPECT_EQ(scheduler_.lastFrame()->pixel(0, 0), 3);
}

TEST_F(RenderSchedulerTest, OnDemandWithoutLoopReturnsLastFrame) {
  EXPECT_EQ(scheduler_.renderOnDemand(50), nullptr);
  ASSERT_TRUE(scheduler_.renderOnce());
  EXPECT_EQ(scheduler_.renderOnDemand(50), scheduler_.lastFrame());
  EXPECT_EQ(renderer_.calls.load(), 1u);
}

TEST_F(RenderSchedulerSlowPanelTest, NavigationWakesLoopAndRendersNewPanel) {
  ASSERT_EQ(nav_.current(), PanelId::kDayLength);
  ASSERT_EQ(panelRefreshIntervalMs(PanelId::kDayLength), 3600000u);
  startLoop();
  const uint32_t before = scheduler_.renderCount();
  (void)nav_.next();
  // Far inside the hourly interval, so only the wake can explain a render.
  ASSERT_TRUE(waitFor([&] { return renderer_.lastPanel.load() == PanelId::kSolar; }, 250));
  EXPECT_GT(scheduler_.renderCount(), before);
}

TEST_F(RenderSchedulerTest, OnDemandRenderProducesFreshFrame) {
  startLoop();
  const uint32_t before = renderer_.calls.load();
  const auto frame = scheduler_.renderOnDemand(2000);
  ASSERT_NE(frame, nullptr);
  EXPECT_GT(renderer_.calls.load(), before);
}

TEST_F(RenderSchedulerTest, StopEndsLoop) {
  startLoop();
  scheduler_.requestStop();
  thread_.join();
  EXPECT_FALSE(scheduler_.running());
  EXPECT_TRUE(scheduler_.stopRequested());
  // Once stopped, on-demand requests fall back immediately.
  EXPECT_EQ(scheduler_.renderOnDemand(10), scheduler_.lastFrame());
}
