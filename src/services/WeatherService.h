#pragma once

#include <ArduinoJson.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/TimedCache.h"

struct CurrentWeather {
  double temperature = 0.0;
  double feelsLike = 0.0;
  int humidity = 0;
  std::string description;
  double windSpeed = 0.0;
  std::string windDirection;
};

struct DailyForecast {
  std::string date;  // YYYY-MM-DD
  double high = 0.0;
  double low = 0.0;
  int rainChancePct = 0;
};

struct WeatherBundle {
  CurrentWeather current;
  std::vector<DailyForecast> forecast;
};

struct AirQuality {
  int aqi = 0;
  std::string category;
  double pm25 = 0.0;
  double pm10 = 0.0;
  double o3 = 0.0;
  double no2 = 0.0;
  double so2 = 0.0;
  double co = 0.0;
};

struct WeatherConfig {
  std::string apiKey;
  double latitude = 0.0;
  double longitude = 0.0;
  std::string units = "imperial";
  bool weatherEnabled = true;
  bool airQualityEnabled = true;
  uint32_t weatherIntervalS = 900;
  uint32_t airQualityIntervalS = 1800;
};

namespace weather {

constexpr size_t kMaxForecastDays = 5;

bool parseCurrent(JsonVariantConst doc, CurrentWeather& out);
// Groups 3-hourly samples by calendar date. Malformed samples are skipped;
// fails only when the document has no sample list at all.
bool parseForecast(JsonVariantConst doc, std::vector<DailyForecast>& out);
bool parseAirQuality(JsonVariantConst doc, AirQuality& out);

int pm25ToAqi(double pm25);
const char* aqiCategory(int aqi);
const char* degreesToCompass(double degrees);
std::string titleCase(const std::string& text);

std::string currentUrl(const WeatherConfig& cfg);
std::string forecastUrl(const WeatherConfig& cfg);
std::string airQualityUrl(const WeatherConfig& cfg);

}  // namespace weather

class WeatherService {
 public:
  using JsonFetcher =
      std::function<bool(const std::string& url, JsonDocument& doc, std::string* error)>;

  using Clock = std::function<uint32_t()>;

  WeatherService(WeatherConfig config, JsonFetcher fetcher, Clock clock = &platform::millisMs);

  bool weatherEnabled() const;
  bool airQualityEnabled() const;

  // May block on the network. Called from the network task only.
  std::optional<WeatherBundle> weather();
  std::optional<AirQuality> airQuality();

  std::optional<WeatherBundle> peekWeather() const { return weatherCache_.peek(); }
  std::optional<AirQuality> peekAirQuality() const { return airCache_.peek(); }

  TimedCache<WeatherBundle>& weatherCache() { return weatherCache_; }
  TimedCache<AirQuality>& airQualityCache() { return airCache_; }

 private:
  bool fetchWeather(WeatherBundle& out);
  bool fetchAirQuality(AirQuality& out);

  WeatherConfig config_;
  JsonFetcher fetcher_;
  TimedCache<WeatherBundle> weatherCache_;
  TimedCache<AirQuality> airCache_;
};
