#include <gtest/gtest.h>

#include <cstring>
#include <vector>

#include "AppConfig.h"
#include "core/GestureClassifier.h"
#include "core/NavigationState.h"

namespace {

// Raw value = pixel * 10 on both axes.
TouchCalibration tenPerPixel() {
  TouchCalibration cal;
  cal.rawMinX = 0;
  cal.rawMaxX = 3200;
  cal.rawMinY = 0;
  cal.rawMaxY = 2400;
  return cal;
}

class GestureClassifierTest : public ::testing::Test {
 protected:
  GestureClassifierTest() : mapper_(320, 240, tenPerPixel()), classifier_(mapper_, config()) {}

  static GestureConfig config() {
    GestureConfig cfg;
    cfg.swipeThresholdPx = 80;
    cfg.tapThresholdPx = 30;
    cfg.tapTimeoutMs = 400;
    return cfg;
  }

  void sample(uint16_t x, uint16_t y, uint32_t t) {
    Gesture ignored;
    EXPECT_FALSE(classifier_.onEvent(
        TouchEvent::axisSample(TouchAxis::kX, static_cast<uint16_t>(x * 10), t), ignored));
    EXPECT_FALSE(classifier_.onEvent(
        TouchEvent::axisSample(TouchAxis::kY, static_cast<uint16_t>(y * 10), t), ignored));
  }

  void down(uint32_t t) {
    Gesture ignored;
    EXPECT_FALSE(classifier_.onEvent(TouchEvent::down(t), ignored));
  }

  bool up(uint32_t t, Gesture& out) { return classifier_.onEvent(TouchEvent::up(t), out); }

  Gesture stroke(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1, uint32_t durationMs) {
    down(0);
    sample(x0, y0, 0);
    sample(x1, y1, durationMs / 2);
    Gesture g;
    EXPECT_TRUE(up(durationMs, g));
    return g;
  }

  TouchMapper mapper_;
  GestureClassifier classifier_;
};

}  // namespace

TEST_F(GestureClassifierTest, LeftwardSwipeGoesToNextPanel) {
  const Gesture g = stroke(300, 120, 100, 120, 200);
  EXPECT_EQ(g.type, GestureType::kSwipe);
  EXPECT_EQ(g.direction, SwipeDirection::kNext);
  EXPECT_STREQ(gestureName(g), "swipe-next");
}

TEST_F(GestureClassifierTest, RightwardSwipeGoesBack) {
  const Gesture g = stroke(50, 120, 300, 120, 900);
  EXPECT_EQ(g.type, GestureType::kSwipe);
  EXPECT_EQ(g.direction, SwipeDirection::kPrev);
}

TEST_F(GestureClassifierTest, SwipeNeedsMoreThanThreshold) {
  // dx == threshold is not a swipe, and too far for a tap.
  const Gesture g = stroke(100, 120, 180, 120, 100);
  EXPECT_EQ(g.type, GestureType::kNone);
  EXPECT_STREQ(g.reason, "ambiguous-motion");
}

TEST_F(GestureClassifierTest, ShortStillTouchIsTapAtReleasePoint) {
  const Gesture g = stroke(160, 120, 165, 120, 100);
  EXPECT_EQ(g.type, GestureType::kTap);
  EXPECT_EQ(g.x, 165);
  EXPECT_EQ(g.y, 120);
}

TEST_F(GestureClassifierTest, SlowStillTouchIsNotATap) {
  const Gesture g = stroke(160, 120, 160, 120, 500);
  EXPECT_EQ(g.type, GestureType::kNone);
  EXPECT_STREQ(g.reason, "slow");
}

TEST_F(GestureClassifierTest, VerticalMotionIsIgnored) {
  const Gesture g = stroke(160, 30, 160, 180, 150);
  EXPECT_EQ(g.type, GestureType::kNone);
}

TEST_F(GestureClassifierTest, UpWithoutSamplesClosesCycleWithNoGesture) {
  down(0);
  Gesture g;
  ASSERT_TRUE(up(50, g));
  EXPECT_EQ(g.type, GestureType::kNone);
  EXPECT_STREQ(g.reason, "no-sample");
  EXPECT_EQ(classifier_.state(), GestureClassifier::State::kIdle);
}

TEST_F(GestureClassifierTest, UpWithoutDownIsIgnored) {
  Gesture g;
  EXPECT_FALSE(up(10, g));
}

TEST_F(GestureClassifierTest, SamplesBeforeDownAreStale) {
  sample(10, 10, 0);
  down(5);
  Gesture ignored;
  (void)classifier_.onEvent(TouchEvent::axisSample(TouchAxis::kX, 1600, 6), ignored);
  EXPECT_EQ(classifier_.state(), GestureClassifier::State::kTracking);
  Gesture g;
  ASSERT_TRUE(up(50, g));
  EXPECT_EQ(g.type, GestureType::kNone);
}

TEST_F(GestureClassifierTest, ArmsOnceBothAxesReport) {
  down(0);
  EXPECT_EQ(classifier_.state(), GestureClassifier::State::kTracking);
  sample(160, 120, 1);
  EXPECT_EQ(classifier_.state(), GestureClassifier::State::kArmed);
  EXPECT_EQ(classifier_.current().x, 160);
  EXPECT_EQ(classifier_.current().y, 120);
}

TEST_F(GestureClassifierTest, BackToBackGesturesStepOnceEach) {
  struct Stroke {
    uint16_t x0, y0, x1, y1;
    uint32_t durationMs;
  };
  // Swipe next, swipe next, swipe back, tap on the next button, tap on content.
  const Stroke strokes[] = {{300, 120, 100, 120, 200}, {280, 90, 60, 100, 250},
                            {40, 120, 290, 110, 300},  {300, 220, 302, 220, 100},
                            {160, 100, 161, 100, 80}};
  const NavBarLayout layout = NavBarLayout::fromAppConfig(320, 240, 40);
  platform::WakeSignal wake;
  NavigationState nav(defaultPanelOrder(), 0, wake);

  std::vector<size_t> positions;
  uint32_t t = 1000;
  int closed = 0;
  for (const Stroke& s : strokes) {
    // Hover noise between touches must not open or close a cycle.
    sample(10, 10, t);
    EXPECT_EQ(classifier_.state(), GestureClassifier::State::kIdle);

    down(t);
    const int steps = 4;
    for (int i = 0; i <= steps; ++i) {
      const uint16_t x = static_cast<uint16_t>(s.x0 + (s.x1 - s.x0) * i / steps);
      const uint16_t y = static_cast<uint16_t>(s.y0 + (s.y1 - s.y0) * i / steps);
      sample(x, y, t + s.durationMs * static_cast<uint32_t>(i) / steps);
    }
    Gesture g;
    ASSERT_TRUE(up(t + s.durationMs, g));
    ++closed;
    // A repeated release belongs to no cycle.
    Gesture again;
    EXPECT_FALSE(up(t + s.durationMs + 5, again));

    switch (navActionFor(g, layout)) {
      case NavAction::kNext:
        (void)nav.next();
        break;
      case NavAction::kPrev:
        (void)nav.prev();
        break;
      case NavAction::kNone:
        break;
    }
    positions.push_back(nav.index());
    t += s.durationMs + 500;
  }

  EXPECT_EQ(closed, 5);
  const std::vector<size_t> expected = {1, 2, 1, 2, 2};
  EXPECT_EQ(positions, expected);
  EXPECT_EQ(nav.snapshot().generation, 4u);
}

TEST(NavActionTest, SwipesMapDirectly) {
  const NavBarLayout layout = NavBarLayout::fromAppConfig(320, 240, 40);
  Gesture g;
  g.type = GestureType::kSwipe;
  g.direction = SwipeDirection::kNext;
  EXPECT_EQ(navActionFor(g, layout), NavAction::kNext);
  g.direction = SwipeDirection::kPrev;
  EXPECT_EQ(navActionFor(g, layout), NavAction::kPrev);
}

TEST(NavActionTest, TapsOnlyActInsideNavButtons) {
  const NavBarLayout layout = NavBarLayout::fromAppConfig(320, 240, 40);
  Gesture g;
  g.type = GestureType::kTap;
  g.x = 30;
  g.y = 220;
  EXPECT_EQ(navActionFor(g, layout), NavAction::kPrev);
  g.x = 300;
  EXPECT_EQ(navActionFor(g, layout), NavAction::kNext);
  g.x = 160;
  EXPECT_EQ(navActionFor(g, layout), NavAction::kNone);
  g.x = 30;
  g.y = 100;
  EXPECT_EQ(navActionFor(g, layout), NavAction::kNone);
}

TEST(NavActionTest, HitRectsStayInsideBar) {
  const NavBarLayout layout = NavBarLayout::fromAppConfig(320, 240, 40);
  const UiRect prev = layout.prevHitRect();
  EXPECT_EQ(prev.x, 0);
  EXPECT_EQ(prev.y, 200);
  EXPECT_EQ(prev.x + prev.w, 10 + AppConfig::kNavButtonWidth + AppConfig::kNavHitMargin);
  EXPECT_EQ(prev.y + prev.h, 240);
  const UiRect next = layout.nextHitRect();
  EXPECT_EQ(next.x + next.w, 320);
}
