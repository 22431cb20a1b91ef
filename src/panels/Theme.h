#pragma once

#include <cstdint>

struct Palette {
  const char* name;
  uint16_t background;
  uint16_t panel;
  uint16_t textPrimary;
  uint16_t textSecondary;
  uint16_t textTertiary;
  uint16_t navBackground;
  uint16_t navButton;
  uint16_t navDotActive;
  uint16_t navDotInactive;
  uint16_t clockFace;
  uint16_t clockHands;
  uint16_t clockMarkers;
  uint16_t divider;
};

namespace palette {

const Palette& day();
const Palette& night();
const Palette& forDaytime(bool isDaytime);

// Accents shared by both themes.
uint16_t sun();
uint16_t sunset();
uint16_t sky();
uint16_t nightSky();
uint16_t moonLight();
uint16_t moonShadow();
uint16_t alert();
uint16_t aqiColor(int aqi);

}  // namespace palette
