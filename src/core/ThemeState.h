#pragma once

#include <cstdint>
#include <ctime>
#include <functional>
#include <string>

#include "platform/Sync.h"

class SolarCalc;

enum class ThemeMode : uint8_t { kAuto = 0, kDay, kNight };

const char* themeModeName(ThemeMode mode);
bool parseThemeMode(const std::string& text, ThemeMode& out);

// Day/night selection. In auto mode the answer follows sunrise/sunset for
// the configured location and is recomputed at most once per cache period.
class ThemeState {
 public:
  using WallClock = std::function<time_t()>;
  using Clock = std::function<uint32_t()>;

  ThemeState(const SolarCalc* solar, ThemeMode mode, uint32_t cacheTtlMs = 60000,
             WallClock wallClock = nullptr, Clock clock = nullptr);

  void setMode(ThemeMode mode);
  ThemeMode mode() const;
  bool isDaytime();
  // "day" or "night".
  const char* activeTheme();
  // {"mode":..,"active_theme":..,"is_daytime":..}
  std::string statusJson();

 private:
  bool computeDaytime(time_t now) const;

  const SolarCalc* solar_;
  const uint32_t cacheTtlMs_;
  WallClock wallClock_;
  Clock clock_;
  mutable platform::Mutex mutex_;
  ThemeMode mode_;
  bool cachedDaytime_ = true;
  bool cacheValid_ = false;
  uint32_t cachedAtMs_ = 0;
};
