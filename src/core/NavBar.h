#pragma once

#include <cstdint>

struct UiRect {
  int16_t x = 0;
  int16_t y = 0;
  uint16_t w = 0;
  uint16_t h = 0;

  bool contains(uint16_t px, uint16_t py) const {
    return px >= x && py >= y && px < x + w && py < y + h;
  }
};

enum class NavAction : uint8_t { kNone = 0, kPrev, kNext };

// Geometry of the bottom navigation strip. Shared by the panel renderer (drawn
// buttons) and the tap resolver (hit rectangles).
struct NavBarLayout {
  uint16_t screenWidth = 0;
  uint16_t screenHeight = 0;
  uint16_t barHeight = 0;
  uint16_t buttonWidth = 0;
  uint16_t buttonHeight = 0;
  uint16_t inset = 0;
  uint16_t hitMargin = 0;

  static NavBarLayout fromAppConfig(uint16_t screenWidth, uint16_t screenHeight,
                                    uint16_t barHeight);

  uint16_t top() const;
  UiRect bar() const;
  UiRect prevButton() const;
  UiRect nextButton() const;
  // Drawn button grown by hitMargin, clipped to the bar strip.
  UiRect prevHitRect() const;
  UiRect nextHitRect() const;
  NavAction hitTest(uint16_t x, uint16_t y) const;
};
