#include "core/GestureClassifier.h"

#include <cstdlib>

TouchEvent TouchEvent::down(uint32_t timeMs) {
  TouchEvent ev;
  ev.type = TouchEventType::kDown;
  ev.timeMs = timeMs;
  return ev;
}

TouchEvent TouchEvent::up(uint32_t timeMs) {
  TouchEvent ev;
  ev.type = TouchEventType::kUp;
  ev.timeMs = timeMs;
  return ev;
}

TouchEvent TouchEvent::axisSample(TouchAxis axis, uint16_t raw, uint32_t timeMs) {
  TouchEvent ev;
  ev.type = TouchEventType::kAxis;
  ev.axis = axis;
  ev.value = raw;
  ev.timeMs = timeMs;
  return ev;
}

GestureClassifier::GestureClassifier(const TouchMapper& mapper, const GestureConfig& config)
    : mapper_(mapper), config_(config) {}

void GestureClassifier::reset() {
  state_ = State::kIdle;
  haveX_ = false;
  haveY_ = false;
}

bool GestureClassifier::onEvent(const TouchEvent& event, Gesture& out) {
  switch (event.type) {
    case TouchEventType::kDown:
      // A second down without an up restarts tracking.
      state_ = State::kTracking;
      haveX_ = false;
      haveY_ = false;
      return false;

    case TouchEventType::kAxis:
      onAxis(event);
      return false;

    case TouchEventType::kUp: {
      if (state_ == State::kArmed) {
        out = classify(event.timeMs);
      } else {
        out = Gesture();
        out.reason = state_ == State::kTracking ? "no-sample" : "no-down";
      }
      const bool completed = state_ != State::kIdle;
      reset();
      return completed;
    }
  }
  return false;
}

void GestureClassifier::onAxis(const TouchEvent& event) {
  if (state_ == State::kIdle) {
    return;
  }
  if (event.axis == TouchAxis::kX) {
    rawX_ = event.value;
    haveX_ = true;
  } else {
    rawY_ = event.value;
    haveY_ = true;
  }
  if (!haveX_ || !haveY_) {
    return;
  }
  current_ = mapper_.map(rawX_, rawY_);
  if (state_ == State::kTracking) {
    start_ = current_;
    startMs_ = event.timeMs;
    state_ = State::kArmed;
  }
}

Gesture GestureClassifier::classify(uint32_t nowMs) const {
  const int32_t dx = static_cast<int32_t>(current_.x) - static_cast<int32_t>(start_.x);
  const int32_t dy = static_cast<int32_t>(current_.y) - static_cast<int32_t>(start_.y);
  const uint32_t durationMs = nowMs - startMs_;
  const int32_t adx = std::abs(dx);
  const int32_t ady = std::abs(dy);

  Gesture g;
  g.x = current_.x;
  g.y = current_.y;
  if (adx > config_.swipeThresholdPx && adx > ady) {
    g.type = GestureType::kSwipe;
    // Rightward motion goes back.
    g.direction = dx > 0 ? SwipeDirection::kPrev : SwipeDirection::kNext;
    return g;
  }
  if (adx < config_.tapThresholdPx && ady < config_.tapThresholdPx &&
      durationMs < config_.tapTimeoutMs) {
    g.type = GestureType::kTap;
    return g;
  }
  g.reason = durationMs >= config_.tapTimeoutMs ? "slow" : "ambiguous-motion";
  return g;
}

NavAction navActionFor(const Gesture& gesture, const NavBarLayout& layout) {
  switch (gesture.type) {
    case GestureType::kSwipe:
      return gesture.direction == SwipeDirection::kPrev ? NavAction::kPrev : NavAction::kNext;
    case GestureType::kTap:
      return layout.hitTest(gesture.x, gesture.y);
    case GestureType::kNone:
      return NavAction::kNone;
  }
  return NavAction::kNone;
}

const char* gestureName(const Gesture& gesture) {
  switch (gesture.type) {
    case GestureType::kSwipe:
      return gesture.direction == SwipeDirection::kPrev ? "swipe-prev" : "swipe-next";
    case GestureType::kTap:
      return "tap";
    case GestureType::kNone:
      return "none";
  }
  return "none";
}
