#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/GestureClassifier.h"
#include "core/ThemeState.h"
#include "core/TouchMapper.h"

struct LocationSettings {
  std::string name = "Unknown";
  std::string timezone;
  double latitude = 0.0;
  double longitude = 0.0;
};

struct DisplaySettings {
  int width = 0;
  int height = 0;
  int navBarHeight = 0;
  // ILI9341 MADCTL quarter turns; odd values are landscape.
  int rotation = 1;
  bool colorBgr = false;
  bool invertColors = true;
};

struct HttpServerSettings {
  bool enabled = true;
  int port = 0;
  int rateLimitPerSecond = 0;
};

struct WeatherSettings {
  bool enabled = true;
  int updateIntervalS = 0;
  std::string units = "imperial";
};

struct AirQualitySettings {
  bool enabled = true;
  int updateIntervalS = 0;
};

struct TouchSettings {
  bool enabled = true;
  int pressureThreshold = 0;
  TouchCalibration calibration;
  GestureConfig gesture;
};

struct AppearanceSettings {
  int defaultPanel = 0;
  ThemeMode themeMode = ThemeMode::kAuto;
  std::string themeModeText = "auto";
};

struct SecretSettings {
  std::string wifiSsid;
  std::string wifiPassword;
  std::string openWeatherApiKey;
  std::string httpUser;
  std::string httpPassword;

  bool authEnabled() const { return !httpUser.empty() && !httpPassword.empty(); }
};

// Contents of /littlefs/config.json layered over the AppConfig defaults.
struct AppSettings {
  LocationSettings location;
  DisplaySettings display;
  HttpServerSettings httpServer;
  WeatherSettings weather;
  AirQualitySettings airQuality;
  TouchSettings touch;
  AppearanceSettings appearance;
  SecretSettings secrets;

  static AppSettings defaults();

  // Every problem found, one message each. Empty when valid.
  std::vector<std::string> validate() const;

  // Missing keys keep their defaults. Returns false on malformed JSON or
  // failed validation, leaving `out` untouched.
  static bool loadFromString(const std::string& json, AppSettings& out,
                             std::vector<std::string>* errors = nullptr);
  // A missing file is not an error: `out` becomes the defaults.
  static bool loadFromFile(const char* path, AppSettings& out,
                           std::vector<std::string>* errors = nullptr);
};
