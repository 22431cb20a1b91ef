#include "core/ThemeState.h"

#include <ArduinoJson.h>

#include <cctype>
#include <utility>

#include "platform/Platform.h"
#include "services/SolarCalc.h"

namespace {
constexpr const char* kTag = "theme";
constexpr int kFallbackDayStartHour = 6;
constexpr int kFallbackDayEndHour = 20;

time_t systemNow() { return std::time(nullptr); }
}  // namespace

const char* themeModeName(ThemeMode mode) {
  switch (mode) {
    case ThemeMode::kAuto:
      return "auto";
    case ThemeMode::kDay:
      return "day";
    case ThemeMode::kNight:
      return "night";
  }
  return "auto";
}

bool parseThemeMode(const std::string& text, ThemeMode& out) {
  std::string lower;
  lower.reserve(text.size());
  for (char c : text) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "auto") {
    out = ThemeMode::kAuto;
  } else if (lower == "day") {
    out = ThemeMode::kDay;
  } else if (lower == "night") {
    out = ThemeMode::kNight;
  } else {
    return false;
  }
  return true;
}

ThemeState::ThemeState(const SolarCalc* solar, ThemeMode mode, uint32_t cacheTtlMs,
                       WallClock wallClock, Clock clock)
    : solar_(solar),
      cacheTtlMs_(cacheTtlMs),
      wallClock_(wallClock ? std::move(wallClock) : WallClock(&systemNow)),
      clock_(clock ? std::move(clock) : Clock(&platform::millisMs)),
      mode_(mode) {}

void ThemeState::setMode(ThemeMode mode) {
  platform::LockGuard lock(mutex_);
  if (mode_ != mode) {
    platform::logi(kTag, "mode %s -> %s", themeModeName(mode_), themeModeName(mode));
  }
  mode_ = mode;
}

ThemeMode ThemeState::mode() const {
  platform::LockGuard lock(mutex_);
  return mode_;
}

bool ThemeState::isDaytime() {
  platform::LockGuard lock(mutex_);
  const uint32_t nowMs = clock_();
  if (cacheValid_ && (nowMs - cachedAtMs_) < cacheTtlMs_) {
    return cachedDaytime_;
  }
  cachedDaytime_ = computeDaytime(wallClock_());
  cachedAtMs_ = nowMs;
  cacheValid_ = true;
  return cachedDaytime_;
}

const char* ThemeState::activeTheme() {
  switch (mode()) {
    case ThemeMode::kDay:
      return "day";
    case ThemeMode::kNight:
      return "night";
    case ThemeMode::kAuto:
      break;
  }
  return isDaytime() ? "day" : "night";
}

std::string ThemeState::statusJson() {
  JsonDocument doc;
  doc["mode"] = themeModeName(mode());
  doc["active_theme"] = activeTheme();
  doc["is_daytime"] = isDaytime();
  std::string out;
  serializeJson(doc, out);
  return out;
}

bool ThemeState::computeDaytime(time_t now) const {
  if (solar_ != nullptr) {
    const std::optional<SunTimes> times = solar_->sunTimes(now);
    if (times) {
      return now >= times->sunrise && now < times->sunset;
    }
    // Polar day or night: the sun stays on one side of the horizon.
    return solar_->position(now).elevationDeg > -0.833;
  }
  struct tm local = {};
  localtime_r(&now, &local);
  return local.tm_hour >= kFallbackDayStartHour && local.tm_hour < kFallbackDayEndHour;
}
