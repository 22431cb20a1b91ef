#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class PanelId : uint8_t {
  kClock = 0,
  kWeather,
  kAirQuality,
  kSunPath,
  kDayLength,
  kSolar,
  kMoon,
  kAnalemma,
  kAnalogClock,
};

constexpr size_t kPanelCount = 9;

const char* panelName(PanelId id);
uint32_t panelRefreshIntervalMs(PanelId id);
bool parsePanelId(const std::string& name, PanelId& out);
std::vector<PanelId> defaultPanelOrder();
