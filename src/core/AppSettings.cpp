#include "core/AppSettings.h"

#include <ArduinoJson.h>

#include <cstdio>
#include <utility>

#include "AppConfig.h"
#include "core/PanelId.h"
#include "platform/Fs.h"
#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "config";

std::string format(const char* fmt, double a) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), fmt, a);
  return buf;
}

std::string stringOr(JsonVariantConst v, const std::string& fallback) {
  return v.is<const char*>() ? std::string(v.as<const char*>()) : fallback;
}

void readLocation(JsonObjectConst obj, LocationSettings& s) {
  s.name = stringOr(obj["name"], s.name);
  s.timezone = stringOr(obj["timezone"], s.timezone);
  s.latitude = obj["latitude"] | s.latitude;
  s.longitude = obj["longitude"] | s.longitude;
}

void readDisplay(JsonObjectConst obj, DisplaySettings& s) {
  s.width = obj["width"] | s.width;
  s.height = obj["height"] | s.height;
  s.navBarHeight = obj["nav_bar_height"] | s.navBarHeight;
  s.rotation = obj["rotation"] | s.rotation;
  s.colorBgr = obj["bgr"] | s.colorBgr;
  s.invertColors = obj["invert"] | s.invertColors;
}

void readHttpServer(JsonObjectConst obj, HttpServerSettings& s) {
  s.enabled = obj["enabled"] | s.enabled;
  s.port = obj["port"] | s.port;
  s.rateLimitPerSecond = obj["rate_limit_per_second"] | s.rateLimitPerSecond;
}

void readWeather(JsonObjectConst obj, WeatherSettings& s) {
  s.enabled = obj["enabled"] | s.enabled;
  s.updateIntervalS = obj["update_interval_seconds"] | s.updateIntervalS;
  s.units = stringOr(obj["units"], s.units);
}

void readAirQuality(JsonObjectConst obj, AirQualitySettings& s) {
  s.enabled = obj["enabled"] | s.enabled;
  s.updateIntervalS = obj["update_interval_seconds"] | s.updateIntervalS;
}

void readTouch(JsonObjectConst obj, TouchSettings& s) {
  s.enabled = obj["enabled"] | s.enabled;
  s.pressureThreshold = obj["pressure_threshold"] | s.pressureThreshold;
  s.gesture.swipeThresholdPx = obj["swipe_threshold"] | s.gesture.swipeThresholdPx;
  s.gesture.tapThresholdPx = obj["tap_threshold"] | s.gesture.tapThresholdPx;
  if (obj["tap_timeout"].is<double>()) {
    // Seconds in the file, milliseconds in memory.
    const double seconds = obj["tap_timeout"].as<double>();
    s.gesture.tapTimeoutMs = seconds > 0.0 ? static_cast<uint32_t>(seconds * 1000.0 + 0.5) : 0;
  }

  TouchCalibration& cal = s.calibration;
  cal.rawMinX = obj["raw_min_x"] | cal.rawMinX;
  cal.rawMaxX = obj["raw_max_x"] | cal.rawMaxX;
  cal.rawMinY = obj["raw_min_y"] | cal.rawMinY;
  cal.rawMaxY = obj["raw_max_y"] | cal.rawMaxY;
  cal.swapXY = obj["swap_xy"] | cal.swapXY;
  cal.invertX = obj["invert_x"] | cal.invertX;
  cal.invertY = obj["invert_y"] | cal.invertY;
}

void readAppearance(JsonObjectConst obj, AppearanceSettings& s) {
  s.defaultPanel = obj["default_view"] | s.defaultPanel;
  s.themeModeText = stringOr(obj["theme_mode"], s.themeModeText);
  ThemeMode mode = s.themeMode;
  if (parseThemeMode(s.themeModeText, mode)) {
    s.themeMode = mode;
  }
}

void readSecrets(JsonObjectConst obj, SecretSettings& s) {
  s.wifiSsid = stringOr(obj["wifi_ssid"], s.wifiSsid);
  s.wifiPassword = stringOr(obj["wifi_password"], s.wifiPassword);
  s.openWeatherApiKey = stringOr(obj["openweather_api_key"], s.openWeatherApiKey);
  s.httpUser = stringOr(obj["http_user"], s.httpUser);
  s.httpPassword = stringOr(obj["http_password"], s.httpPassword);
}

}  // namespace

AppSettings AppSettings::defaults() {
  AppSettings s;
  s.location.timezone = AppConfig::kDefaultTimezone;
  s.location.latitude = AppConfig::kDefaultLatitude;
  s.location.longitude = AppConfig::kDefaultLongitude;

  s.display.width = AppConfig::kScreenWidth;
  s.display.height = AppConfig::kScreenHeight;
  s.display.navBarHeight = AppConfig::kNavBarHeight;
  s.display.rotation = AppConfig::kRotation;

  s.httpServer.enabled = AppConfig::kHttpServerEnabled;
  s.httpServer.port = AppConfig::kHttpPort;
  s.httpServer.rateLimitPerSecond = AppConfig::kHttpRateLimitPerSecond;

  s.weather.updateIntervalS = static_cast<int>(AppConfig::kWeatherIntervalS);
  s.airQuality.updateIntervalS = static_cast<int>(AppConfig::kAirQualityIntervalS);

  s.touch.enabled = AppConfig::kTouchEnabled;
  s.touch.pressureThreshold = AppConfig::kTouchPressureThreshold;
  TouchCalibration& cal = s.touch.calibration;
  cal.rawMinX = AppConfig::kTouchRawMinX;
  cal.rawMaxX = AppConfig::kTouchRawMaxX;
  cal.rawMinY = AppConfig::kTouchRawMinY;
  cal.rawMaxY = AppConfig::kTouchRawMaxY;
  cal.swapXY = AppConfig::kTouchSwapXY;
  cal.invertX = AppConfig::kTouchInvertX;
  cal.invertY = AppConfig::kTouchInvertY;
  cal.invertBeforeSwap = AppConfig::kTouchInvertBeforeSwap;
  s.touch.gesture.swipeThresholdPx = AppConfig::kSwipeThresholdPx;
  s.touch.gesture.tapThresholdPx = AppConfig::kTapThresholdPx;
  s.touch.gesture.tapTimeoutMs = AppConfig::kTapTimeoutMs;
  return s;
}

std::vector<std::string> AppSettings::validate() const {
  std::vector<std::string> errors;
  if (!(location.latitude >= -90.0 && location.latitude <= 90.0)) {
    errors.push_back(format("Invalid latitude %.4f: must be -90 to 90", location.latitude));
  }
  if (!(location.longitude >= -180.0 && location.longitude <= 180.0)) {
    errors.push_back(format("Invalid longitude %.4f: must be -180 to 180", location.longitude));
  }
  if (location.timezone.empty()) {
    errors.push_back("Timezone must not be empty");
  }

  if (display.width <= 0 || display.height <= 0) {
    errors.push_back("Invalid display dimensions: " + std::to_string(display.width) + "x" +
                     std::to_string(display.height));
  }
  if (display.navBarHeight < 0 || display.navBarHeight > display.height) {
    errors.push_back("Invalid nav_bar_height: " + std::to_string(display.navBarHeight));
  }
  if (display.rotation < 0 || display.rotation > 3) {
    errors.push_back("Invalid display rotation: " + std::to_string(display.rotation));
  }

  if (httpServer.port < 1 || httpServer.port > 65535) {
    errors.push_back("Invalid port " + std::to_string(httpServer.port) + ": must be 1-65535");
  }
  if (httpServer.rateLimitPerSecond < 1) {
    errors.push_back("Rate limit must be at least 1 request per second");
  }

  if (weather.updateIntervalS < 60) {
    errors.push_back("Weather update interval must be at least 60 seconds");
  }
  if (weather.units != "imperial" && weather.units != "metric") {
    errors.push_back("Invalid units '" + weather.units + "': must be 'imperial' or 'metric'");
  }
  if (airQuality.updateIntervalS < 60) {
    errors.push_back("Air quality update interval must be at least 60 seconds");
  }

  if (touch.gesture.swipeThresholdPx <= 0) {
    errors.push_back("Swipe threshold must be positive");
  }
  if (touch.gesture.tapThresholdPx <= 0) {
    errors.push_back("Tap threshold must be positive");
  }
  if (touch.gesture.tapTimeoutMs == 0) {
    errors.push_back("Tap timeout must be positive");
  }
  if (touch.pressureThreshold <= 0 || touch.pressureThreshold > 4095) {
    errors.push_back("Touch pressure_threshold must be 1 to 4095");
  }
  if (touch.calibration.rawMaxX <= touch.calibration.rawMinX ||
      touch.calibration.rawMaxY <= touch.calibration.rawMinY) {
    errors.push_back("Touch calibration max must exceed min");
  }

  const int maxPanel = static_cast<int>(kPanelCount) - 1;
  if (appearance.defaultPanel < 0 || appearance.defaultPanel > maxPanel) {
    errors.push_back("Invalid default_view " + std::to_string(appearance.defaultPanel) +
                     ": must be 0-" + std::to_string(maxPanel));
  }
  ThemeMode mode = ThemeMode::kAuto;
  if (!parseThemeMode(appearance.themeModeText, mode)) {
    errors.push_back("Invalid theme_mode '" + appearance.themeModeText +
                     "': must be 'auto', 'day', or 'night'");
  }
  return errors;
}

bool AppSettings::loadFromString(const std::string& json, AppSettings& out,
                                 std::vector<std::string>* errors) {
  JsonDocument doc;
  const DeserializationError err = deserializeJson(doc, json);
  if (err) {
    if (errors != nullptr) {
      errors->push_back(std::string("Invalid JSON in config file: ") + err.c_str());
    }
    return false;
  }
  if (!doc.is<JsonObjectConst>()) {
    if (errors != nullptr) {
      errors->push_back("Config root must be a JSON object");
    }
    return false;
  }

  AppSettings loaded = defaults();
  JsonObjectConst root = doc.as<JsonObjectConst>();
  readLocation(root["location"].as<JsonObjectConst>(), loaded.location);
  readDisplay(root["display"].as<JsonObjectConst>(), loaded.display);
  readHttpServer(root["http_server"].as<JsonObjectConst>(), loaded.httpServer);
  readWeather(root["weather"].as<JsonObjectConst>(), loaded.weather);
  readAirQuality(root["air_quality"].as<JsonObjectConst>(), loaded.airQuality);
  readTouch(root["touch"].as<JsonObjectConst>(), loaded.touch);
  readAppearance(root["appearance"].as<JsonObjectConst>(), loaded.appearance);
  readSecrets(root["secrets"].as<JsonObjectConst>(), loaded.secrets);

  std::vector<std::string> problems = loaded.validate();
  if (!problems.empty()) {
    for (const std::string& p : problems) {
      platform::logw(kTag, "invalid: %s", p.c_str());
    }
    if (errors != nullptr) {
      errors->insert(errors->end(), problems.begin(), problems.end());
    }
    return false;
  }
  out = std::move(loaded);
  return true;
}

bool AppSettings::loadFromFile(const char* path, AppSettings& out,
                               std::vector<std::string>* errors) {
  if (!platform::fs::exists(path)) {
    platform::logw(kTag, "no config at %s; using defaults", path);
    out = defaults();
    return true;
  }
  std::string text;
  if (!platform::fs::readFile(path, text)) {
    if (errors != nullptr) {
      errors->push_back(std::string("Cannot read config file ") + path);
    }
    return false;
  }
  platform::logi(kTag, "loading %s bytes=%u", path, static_cast<unsigned>(text.size()));
  return loadFromString(text, out, errors);
}
