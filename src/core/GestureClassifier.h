#pragma once

#include <cstdint>

#include "core/NavBar.h"
#include "core/TouchMapper.h"

enum class TouchEventType : uint8_t { kAxis = 0, kDown, kUp };
enum class TouchAxis : uint8_t { kX = 0, kY };

struct TouchEvent {
  TouchEventType type = TouchEventType::kAxis;
  TouchAxis axis = TouchAxis::kX;
  uint16_t value = 0;
  uint32_t timeMs = 0;

  static TouchEvent down(uint32_t timeMs);
  static TouchEvent up(uint32_t timeMs);
  static TouchEvent axisSample(TouchAxis axis, uint16_t raw, uint32_t timeMs);
};

enum class GestureType : uint8_t { kNone = 0, kSwipe, kTap };
enum class SwipeDirection : uint8_t { kPrev = 0, kNext };

struct Gesture {
  GestureType type = GestureType::kNone;
  SwipeDirection direction = SwipeDirection::kNext;
  uint16_t x = 0;
  uint16_t y = 0;
  const char* reason = "";
};

struct GestureConfig {
  int16_t swipeThresholdPx = 80;
  int16_t tapThresholdPx = 30;
  uint32_t tapTimeoutMs = 400;
};

// One touch-down/up cycle in, one Gesture out.
//
// Idle -> Tracking on down. Tracking -> Armed once both axes have reported
// after the down (earlier samples are stale). Armed -> Idle on up, which
// classifies the motion. An up while still Tracking yields kNone.
class GestureClassifier {
 public:
  enum class State : uint8_t { kIdle = 0, kTracking, kArmed };

  GestureClassifier(const TouchMapper& mapper, const GestureConfig& config);

  // True when the event closed a touch cycle; out then holds the result.
  bool onEvent(const TouchEvent& event, Gesture& out);
  void reset();

  State state() const { return state_; }
  TouchPoint current() const { return current_; }

 private:
  void onAxis(const TouchEvent& event);
  Gesture classify(uint32_t nowMs) const;

  const TouchMapper& mapper_;
  GestureConfig config_;
  State state_ = State::kIdle;
  uint16_t rawX_ = 0;
  uint16_t rawY_ = 0;
  bool haveX_ = false;
  bool haveY_ = false;
  TouchPoint start_;
  uint32_t startMs_ = 0;
  TouchPoint current_;
};

// Swipes map straight to navigation; taps only inside the nav bar buttons.
NavAction navActionFor(const Gesture& gesture, const NavBarLayout& layout);
const char* gestureName(const Gesture& gesture);
