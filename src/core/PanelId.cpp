#include "core/PanelId.h"

#include <cctype>

const char* panelName(PanelId id) {
  switch (id) {
    case PanelId::kClock:
      return "clock";
    case PanelId::kWeather:
      return "weather";
    case PanelId::kAirQuality:
      return "airquality";
    case PanelId::kSunPath:
      return "sunpath";
    case PanelId::kDayLength:
      return "daylength";
    case PanelId::kSolar:
      return "solar";
    case PanelId::kMoon:
      return "moon";
    case PanelId::kAnalemma:
      return "analemma";
    case PanelId::kAnalogClock:
      return "analogclock";
  }
  return "unknown";
}

uint32_t panelRefreshIntervalMs(PanelId id) {
  switch (id) {
    case PanelId::kClock:
    case PanelId::kAnalogClock:
      return 1000;
    case PanelId::kWeather:
    case PanelId::kSunPath:
    case PanelId::kSolar:
      return 60000;
    case PanelId::kAirQuality:
      return 300000;
    case PanelId::kDayLength:
    case PanelId::kMoon:
    case PanelId::kAnalemma:
      return 3600000;
  }
  return 1000;
}

bool parsePanelId(const std::string& name, PanelId& out) {
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  for (PanelId id : defaultPanelOrder()) {
    if (lower == panelName(id)) {
      out = id;
      return true;
    }
  }
  return false;
}

std::vector<PanelId> defaultPanelOrder() {
  return {PanelId::kClock,     PanelId::kWeather, PanelId::kAirQuality,
          PanelId::kSunPath,   PanelId::kDayLength, PanelId::kSolar,
          PanelId::kMoon,      PanelId::kAnalemma,  PanelId::kAnalogClock};
}
