#include "panels/Theme.h"

#include "core/Frame.h"

namespace {

Palette makeNight() {
  Palette p{};
  p.name = "night";
  p.background = rgb565(0, 0, 0);
  p.panel = rgb565(35, 35, 40);
  p.textPrimary = rgb565(255, 255, 255);
  p.textSecondary = rgb565(180, 180, 180);
  p.textTertiary = rgb565(128, 128, 128);
  p.navBackground = rgb565(0, 0, 0);
  p.navButton = rgb565(60, 60, 60);
  p.navDotActive = rgb565(255, 255, 255);
  p.navDotInactive = rgb565(128, 128, 128);
  p.clockFace = rgb565(240, 240, 230);
  p.clockHands = rgb565(0, 0, 0);
  p.clockMarkers = rgb565(50, 50, 50);
  p.divider = rgb565(40, 40, 50);
  return p;
}

Palette makeDay() {
  Palette p{};
  p.name = "day";
  p.background = rgb565(245, 243, 235);
  p.panel = rgb565(230, 228, 220);
  p.textPrimary = rgb565(30, 30, 30);
  p.textSecondary = rgb565(80, 80, 80);
  p.textTertiary = rgb565(120, 120, 120);
  p.navBackground = rgb565(235, 233, 225);
  p.navButton = rgb565(200, 198, 190);
  p.navDotActive = rgb565(30, 30, 30);
  p.navDotInactive = rgb565(160, 160, 160);
  p.clockFace = rgb565(255, 255, 250);
  p.clockHands = rgb565(30, 30, 30);
  p.clockMarkers = rgb565(80, 80, 80);
  p.divider = rgb565(200, 198, 190);
  return p;
}

}  // namespace

namespace palette {

const Palette& day() {
  static const Palette sDay = makeDay();
  return sDay;
}

const Palette& night() {
  static const Palette sNight = makeNight();
  return sNight;
}

const Palette& forDaytime(bool isDaytime) { return isDaytime ? day() : night(); }

uint16_t sun() { return rgb565(255, 220, 50); }
uint16_t sunset() { return rgb565(255, 140, 0); }
uint16_t sky() { return rgb565(100, 149, 237); }
uint16_t nightSky() { return rgb565(25, 25, 112); }
uint16_t moonLight() { return rgb565(255, 248, 220); }
uint16_t moonShadow() { return rgb565(50, 50, 50); }
uint16_t alert() { return rgb565(255, 80, 80); }

uint16_t aqiColor(int aqi) {
  if (aqi <= 50) return rgb565(0, 228, 0);
  if (aqi <= 100) return rgb565(255, 255, 0);
  if (aqi <= 150) return rgb565(255, 126, 0);
  if (aqi <= 200) return rgb565(255, 0, 0);
  if (aqi <= 300) return rgb565(143, 63, 151);
  return rgb565(126, 0, 35);
}

}  // namespace palette
