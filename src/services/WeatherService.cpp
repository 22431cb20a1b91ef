#include "services/WeatherService.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <map>
#include <utility>

#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "weather";
constexpr const char* kBaseUrl = "https://api.openweathermap.org/data/2.5";

struct AqiBreakpoint {
  double pmLow;
  double pmHigh;
  int aqiLow;
  int aqiHigh;
};

constexpr AqiBreakpoint kPm25Breakpoints[] = {
    {0.0, 12.0, 0, 50},        {12.1, 35.4, 51, 100},    {35.5, 55.4, 101, 150},
    {55.5, 150.4, 151, 200},   {150.5, 250.4, 201, 300}, {250.5, 350.4, 301, 400},
    {350.5, 500.4, 401, 500},
};

constexpr const char* kCompassPoints[16] = {"N",  "NNE", "NE", "ENE", "E",  "ESE", "SE", "SSE",
                                            "S",  "SSW", "SW", "WSW", "W",  "WNW", "NW", "NNW"};

double numberOr(JsonVariantConst v, double fallback) {
  return v.is<double>() ? v.as<double>() : fallback;
}

std::string coordsQuery(const WeatherConfig& cfg) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "lat=%.4f&lon=%.4f", cfg.latitude, cfg.longitude);
  return buf;
}

struct DayAccumulator {
  double high = 0.0;
  double low = 0.0;
  int rain = 0;
  size_t samples = 0;
};

}  // namespace

namespace weather {

bool parseCurrent(JsonVariantConst doc, CurrentWeather& out) {
  JsonVariantConst main = doc["main"];
  if (!main["temp"].is<double>()) {
    return false;
  }
  out = CurrentWeather();
  out.temperature = main["temp"].as<double>();
  out.feelsLike = numberOr(main["feels_like"], out.temperature);
  out.humidity = static_cast<int>(numberOr(main["humidity"], 0.0));

  JsonVariantConst desc = doc["weather"][0]["description"];
  out.description = titleCase(desc.is<const char*>() ? desc.as<const char*>() : "");

  out.windSpeed = numberOr(doc["wind"]["speed"], 0.0);
  out.windDirection = degreesToCompass(numberOr(doc["wind"]["deg"], 0.0));
  return true;
}

bool parseForecast(JsonVariantConst doc, std::vector<DailyForecast>& out) {
  out.clear();
  JsonArrayConst list = doc["list"].as<JsonArrayConst>();
  if (list.isNull()) {
    return false;
  }

  std::map<std::string, DayAccumulator> days;
  size_t skipped = 0;
  for (JsonVariantConst item : list) {
    JsonVariantConst dtTxt = item["dt_txt"];
    JsonVariantConst temp = item["main"]["temp"];
    if (!dtTxt.is<const char*>() || !temp.is<double>()) {
      ++skipped;
      continue;
    }
    const std::string stamp = dtTxt.as<const char*>();
    const size_t space = stamp.find(' ');
    if (space == std::string::npos || space == 0) {
      ++skipped;
      continue;
    }

    const double t = temp.as<double>();
    const int rain = static_cast<int>(numberOr(item["pop"], 0.0) * 100.0);
    DayAccumulator& day = days[stamp.substr(0, space)];
    if (day.samples == 0) {
      day.high = t;
      day.low = t;
      day.rain = rain;
    } else {
      day.high = std::max(day.high, t);
      day.low = std::min(day.low, t);
      day.rain = std::max(day.rain, rain);
    }
    ++day.samples;
  }

  for (const auto& kv : days) {
    if (out.size() >= kMaxForecastDays) {
      break;
    }
    DailyForecast f;
    f.date = kv.first;
    f.high = kv.second.high;
    f.low = kv.second.low;
    f.rainChancePct = kv.second.rain;
    out.push_back(std::move(f));
  }
  if (skipped > 0) {
    platform::logw(kTag, "forecast skipped_samples=%u days=%u", static_cast<unsigned>(skipped),
                   static_cast<unsigned>(out.size()));
  }
  return true;
}

bool parseAirQuality(JsonVariantConst doc, AirQuality& out) {
  JsonVariantConst components = doc["list"][0]["components"];
  if (!components.is<JsonObjectConst>()) {
    return false;
  }
  out = AirQuality();
  out.pm25 = numberOr(components["pm2_5"], 0.0);
  out.pm10 = numberOr(components["pm10"], 0.0);
  out.o3 = numberOr(components["o3"], 0.0);
  out.no2 = numberOr(components["no2"], 0.0);
  out.so2 = numberOr(components["so2"], 0.0);
  out.co = numberOr(components["co"], 0.0);
  out.aqi = pm25ToAqi(out.pm25);
  out.category = aqiCategory(out.aqi);
  return true;
}

int pm25ToAqi(double pm25) {
  if (!(pm25 > 0.0)) {
    return 0;
  }
  // Concentrations are truncated to 0.1 ug/m3 so values between two
  // breakpoint ranges (e.g. 12.05) land in the lower one.
  const double pm = std::floor(pm25 * 10.0 + 1e-6) / 10.0;
  for (const AqiBreakpoint& bp : kPm25Breakpoints) {
    if (pm >= bp.pmLow - 1e-9 && pm <= bp.pmHigh + 1e-9) {
      const double aqi =
          (bp.aqiHigh - bp.aqiLow) / (bp.pmHigh - bp.pmLow) * (pm - bp.pmLow) + bp.aqiLow;
      return static_cast<int>(aqi);
    }
  }
  return 500;
}

const char* aqiCategory(int aqi) {
  if (aqi <= 50) return "Good";
  if (aqi <= 100) return "Moderate";
  if (aqi <= 150) return "Unhealthy for Sensitive";
  if (aqi <= 200) return "Unhealthy";
  if (aqi <= 300) return "Very Unhealthy";
  return "Hazardous";
}

const char* degreesToCompass(double degrees) {
  double d = std::fmod(degrees, 360.0);
  if (d < 0.0) {
    d += 360.0;
  }
  const int index = static_cast<int>((d + 11.25) / 22.5) % 16;
  return kCompassPoints[index];
}

std::string titleCase(const std::string& text) {
  std::string out = text;
  bool startOfWord = true;
  for (char& c : out) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      c = static_cast<char>(startOfWord ? std::toupper(uc) : std::tolower(uc));
      startOfWord = false;
    } else {
      startOfWord = true;
    }
  }
  return out;
}

std::string currentUrl(const WeatherConfig& cfg) {
  return std::string(kBaseUrl) + "/weather?" + coordsQuery(cfg) + "&appid=" + cfg.apiKey +
         "&units=" + cfg.units;
}

std::string forecastUrl(const WeatherConfig& cfg) {
  return std::string(kBaseUrl) + "/forecast?" + coordsQuery(cfg) + "&appid=" + cfg.apiKey +
         "&units=" + cfg.units;
}

std::string airQualityUrl(const WeatherConfig& cfg) {
  return std::string(kBaseUrl) + "/air_pollution?" + coordsQuery(cfg) + "&appid=" + cfg.apiKey;
}

}  // namespace weather

WeatherService::WeatherService(WeatherConfig config, JsonFetcher fetcher, Clock clock)
    : config_(std::move(config)),
      fetcher_(std::move(fetcher)),
      weatherCache_("weather", config_.weatherIntervalS * 1000U,
                    [this](WeatherBundle& out) { return fetchWeather(out); }, clock),
      airCache_("air_quality", config_.airQualityIntervalS * 1000U,
                [this](AirQuality& out) { return fetchAirQuality(out); }, clock) {}

bool WeatherService::weatherEnabled() const {
  return config_.weatherEnabled && !config_.apiKey.empty();
}

bool WeatherService::airQualityEnabled() const {
  return config_.airQualityEnabled && !config_.apiKey.empty();
}

std::optional<WeatherBundle> WeatherService::weather() {
  if (!weatherEnabled()) {
    return std::nullopt;
  }
  return weatherCache_.get();
}

std::optional<AirQuality> WeatherService::airQuality() {
  if (!airQualityEnabled()) {
    return std::nullopt;
  }
  return airCache_.get();
}

bool WeatherService::fetchWeather(WeatherBundle& out) {
  if (!fetcher_) {
    return false;
  }
  std::string err;
  JsonDocument doc;
  if (!fetcher_(weather::currentUrl(config_), doc, &err)) {
    platform::logw(kTag, "current fetch failed err='%s'", err.c_str());
    return false;
  }
  if (!weather::parseCurrent(doc.as<JsonVariantConst>(), out.current)) {
    platform::logw(kTag, "current payload malformed");
    return false;
  }

  doc.clear();
  if (!fetcher_(weather::forecastUrl(config_), doc, &err)) {
    platform::logw(kTag, "forecast fetch failed err='%s'", err.c_str());
    return false;
  }
  if (!weather::parseForecast(doc.as<JsonVariantConst>(), out.forecast)) {
    platform::logw(kTag, "forecast payload malformed");
    return false;
  }
  platform::logi(kTag, "temp=%.1f desc='%s' days=%u", out.current.temperature,
                 out.current.description.c_str(), static_cast<unsigned>(out.forecast.size()));
  return true;
}

bool WeatherService::fetchAirQuality(AirQuality& out) {
  if (!fetcher_) {
    return false;
  }
  std::string err;
  JsonDocument doc;
  if (!fetcher_(weather::airQualityUrl(config_), doc, &err)) {
    platform::logw(kTag, "air quality fetch failed err='%s'", err.c_str());
    return false;
  }
  if (!weather::parseAirQuality(doc.as<JsonVariantConst>(), out)) {
    platform::logw(kTag, "air quality payload malformed");
    return false;
  }
  platform::logi(kTag, "aqi=%d category='%s' pm25=%.1f", out.aqi, out.category.c_str(), out.pm25);
  return true;
}
