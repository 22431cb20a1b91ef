#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "services/WeatherService.h"

namespace {

constexpr const char* kCurrentJson = R"({
  "weather": [{"description": "light rain"}],
  "main": {"temp": 61.5, "feels_like": 60.1, "humidity": 82},
  "wind": {"speed": 7.2, "deg": 225}
})";

constexpr const char* kForecastJson = R"({
  "list": [
    {"dt_txt": "2024-03-20 09:00:00", "main": {"temp": 55.0}, "pop": 0.1},
    {"dt_txt": "2024-03-20 15:00:00", "main": {"temp": 64.0}, "pop": 0.6},
    {"dt_txt": "2024-03-20 21:00:00", "main": {"temp": 52.5}},
    {"main": {"temp": 99.0}},
    {"dt_txt": "2024-03-21 12:00:00", "main": {}},
    {"dt_txt": "2024-03-21 15:00:00", "main": {"temp": 70.0}, "pop": 0.0}
  ]
})";

// 2024-03-22 has samples, but none of them carries a usable temperature.
constexpr const char* kForecastWithBrokenDayJson = R"({
  "list": [
    {"dt_txt": "2024-03-21 12:00:00", "main": {"temp": 58.0}, "pop": 0.3},
    {"dt_txt": "2024-03-22 09:00:00", "main": {}},
    {"dt_txt": "2024-03-22 12:00:00", "main": {"temp": "warm"}},
    {"dt_txt": "2024-03-22 15:00:00"},
    {"dt_txt": "2024-03-23 12:00:00", "main": {"temp": 62.0}}
  ]
})";

constexpr const char* kAirJson = R"({
  "list": [{"main": {"aqi": 2}, "components": {
    "pm2_5": 35.5, "pm10": 20.0, "o3": 60.2, "no2": 5.1, "so2": 1.0, "co": 210.3}}]
})";

JsonDocument parse(const char* json) {
  JsonDocument doc;
  EXPECT_FALSE(deserializeJson(doc, json));
  return doc;
}

WeatherConfig testConfig() {
  WeatherConfig cfg;
  cfg.apiKey = "KEY";
  cfg.latitude = 37.422;
  cfg.longitude = -122.0841;
  cfg.units = "metric";
  return cfg;
}

// Serves canned bodies by endpoint name; a missing body is a failed fetch.
struct FakeApi {
  std::map<std::string, std::string> bodies;
  std::vector<std::string> requested;

  WeatherService::JsonFetcher fetcher() {
    return [this](const std::string& url, JsonDocument& doc, std::string* error) {
      requested.push_back(url);
      for (const auto& kv : bodies) {
        if (url.find("/" + kv.first + "?") != std::string::npos) {
          return !deserializeJson(doc, kv.second);
        }
      }
      if (error != nullptr) {
        *error = "HTTP 500";
      }
      return false;
    };
  }
};

}  // namespace

TEST(WeatherParseTest, CurrentConditions) {
  const JsonDocument doc = parse(kCurrentJson);
  CurrentWeather w;
  ASSERT_TRUE(weather::parseCurrent(doc.as<JsonVariantConst>(), w));
  EXPECT_DOUBLE_EQ(w.temperature, 61.5);
  EXPECT_DOUBLE_EQ(w.feelsLike, 60.1);
  EXPECT_EQ(w.humidity, 82);
  EXPECT_EQ(w.description, "Light Rain");
  EXPECT_DOUBLE_EQ(w.windSpeed, 7.2);
  EXPECT_EQ(w.windDirection, "SW");
}

TEST(WeatherParseTest, CurrentWithoutTemperatureIsRejected) {
  const JsonDocument doc = parse(R"({"main": {"humidity": 40}})");
  CurrentWeather w;
  EXPECT_FALSE(weather::parseCurrent(doc.as<JsonVariantConst>(), w));
}

TEST(WeatherParseTest, ForecastGroupsByDateAndSkipsMalformedSamples) {
  const JsonDocument doc = parse(kForecastJson);
  std::vector<DailyForecast> days;
  ASSERT_TRUE(weather::parseForecast(doc.as<JsonVariantConst>(), days));
  ASSERT_EQ(days.size(), 2u);
  EXPECT_EQ(days[0].date, "2024-03-20");
  EXPECT_DOUBLE_EQ(days[0].high, 64.0);
  EXPECT_DOUBLE_EQ(days[0].low, 52.5);
  EXPECT_EQ(days[0].rainChancePct, 60);
  EXPECT_EQ(days[1].date, "2024-03-21");
  EXPECT_DOUBLE_EQ(days[1].high, 70.0);
  EXPECT_DOUBLE_EQ(days[1].low, 70.0);
  EXPECT_EQ(days[1].rainChancePct, 0);
}

TEST(WeatherParseTest, DayWithOnlyMalformedSamplesIsDropped) {
  const JsonDocument doc = parse(kForecastWithBrokenDayJson);
  std::vector<DailyForecast> days;
  ASSERT_TRUE(weather::parseForecast(doc.as<JsonVariantConst>(), days));
  ASSERT_EQ(days.size(), 2u);
  EXPECT_EQ(days[0].date, "2024-03-21");
  EXPECT_DOUBLE_EQ(days[0].high, 58.0);
  EXPECT_EQ(days[0].rainChancePct, 30);
  EXPECT_EQ(days[1].date, "2024-03-23");
  EXPECT_DOUBLE_EQ(days[1].high, 62.0);
  EXPECT_DOUBLE_EQ(days[1].low, 62.0);
}

TEST(WeatherParseTest, ForecastKeepsAtMostFiveDays) {
  JsonDocument doc;
  JsonArray list = doc["list"].to<JsonArray>();
  for (int d = 1; d <= 7; ++d) {
    JsonObject item = list.add<JsonObject>();
    item["dt_txt"] = "2024-04-0" + std::to_string(d) + " 12:00:00";
    item["main"]["temp"] = 50 + d;
  }
  std::vector<DailyForecast> days;
  ASSERT_TRUE(weather::parseForecast(doc.as<JsonVariantConst>(), days));
  ASSERT_EQ(days.size(), weather::kMaxForecastDays);
  EXPECT_EQ(days.front().date, "2024-04-01");
  EXPECT_EQ(days.back().date, "2024-04-05");
}

TEST(WeatherParseTest, EmptyForecastListIsStillValid) {
  std::vector<DailyForecast> days;
  EXPECT_TRUE(weather::parseForecast(parse(R"({"list": []})").as<JsonVariantConst>(), days));
  EXPECT_TRUE(days.empty());
  EXPECT_FALSE(weather::parseForecast(parse(R"({"cod": "401"})").as<JsonVariantConst>(), days));
}

TEST(WeatherParseTest, AirQualityComputesUsAqiFromPm25) {
  const JsonDocument doc = parse(kAirJson);
  AirQuality aq;
  ASSERT_TRUE(weather::parseAirQuality(doc.as<JsonVariantConst>(), aq));
  EXPECT_DOUBLE_EQ(aq.pm25, 35.5);
  EXPECT_DOUBLE_EQ(aq.co, 210.3);
  EXPECT_EQ(aq.aqi, 101);
  EXPECT_EQ(aq.category, "Unhealthy for Sensitive");

  AirQuality missing;
  EXPECT_FALSE(weather::parseAirQuality(parse(R"({"list": []})").as<JsonVariantConst>(), missing));
}

TEST(WeatherParseTest, Pm25BreakpointsTruncateToTenths) {
  EXPECT_EQ(weather::pm25ToAqi(0.0), 0);
  EXPECT_EQ(weather::pm25ToAqi(-4.0), 0);
  EXPECT_EQ(weather::pm25ToAqi(6.0), 25);
  EXPECT_EQ(weather::pm25ToAqi(12.0), 50);
  // Between two ranges: truncated into the lower one.
  EXPECT_EQ(weather::pm25ToAqi(12.05), 50);
  EXPECT_EQ(weather::pm25ToAqi(12.1), 51);
  EXPECT_EQ(weather::pm25ToAqi(55.5), 151);
  EXPECT_EQ(weather::pm25ToAqi(900.0), 500);
}

TEST(WeatherParseTest, AqiCategories) {
  EXPECT_STREQ(weather::aqiCategory(0), "Good");
  EXPECT_STREQ(weather::aqiCategory(50), "Good");
  EXPECT_STREQ(weather::aqiCategory(51), "Moderate");
  EXPECT_STREQ(weather::aqiCategory(200), "Unhealthy");
  EXPECT_STREQ(weather::aqiCategory(300), "Very Unhealthy");
  EXPECT_STREQ(weather::aqiCategory(301), "Hazardous");
}

TEST(WeatherParseTest, CompassPoints) {
  EXPECT_STREQ(weather::degreesToCompass(0.0), "N");
  EXPECT_STREQ(weather::degreesToCompass(45.0), "NE");
  EXPECT_STREQ(weather::degreesToCompass(180.0), "S");
  EXPECT_STREQ(weather::degreesToCompass(350.0), "N");
  EXPECT_STREQ(weather::degreesToCompass(-90.0), "W");
  EXPECT_STREQ(weather::degreesToCompass(720.0 + 90.0), "E");
}

TEST(WeatherParseTest, TitleCase) {
  EXPECT_EQ(weather::titleCase("scattered CLOUDS"), "Scattered Clouds");
  EXPECT_EQ(weather::titleCase(""), "");
}

TEST(WeatherUrlTest, UrlsCarryLocationKeyAndUnits) {
  const WeatherConfig cfg = testConfig();
  const std::string current = weather::currentUrl(cfg);
  EXPECT_EQ(current,
            "https://api.openweathermap.org/data/2.5/weather?lat=37.4220&lon=-122.0841"
            "&appid=KEY&units=metric");
  EXPECT_NE(weather::forecastUrl(cfg).find("/forecast?"), std::string::npos);
  const std::string air = weather::airQualityUrl(cfg);
  EXPECT_NE(air.find("/air_pollution?lat=37.4220"), std::string::npos);
  EXPECT_EQ(air.find("units="), std::string::npos);
}

TEST(WeatherServiceTest, DisabledWithoutApiKey) {
  FakeApi api;
  WeatherConfig cfg = testConfig();
  cfg.apiKey.clear();
  WeatherService service(cfg, api.fetcher());
  EXPECT_FALSE(service.weatherEnabled());
  EXPECT_FALSE(service.airQualityEnabled());
  EXPECT_FALSE(service.weather().has_value());
  EXPECT_FALSE(service.airQuality().has_value());
  EXPECT_TRUE(api.requested.empty());
}

TEST(WeatherServiceTest, FeatureFlagsDisableIndependently) {
  FakeApi api;
  WeatherConfig cfg = testConfig();
  cfg.weatherEnabled = false;
  WeatherService service(cfg, api.fetcher());
  EXPECT_FALSE(service.weatherEnabled());
  EXPECT_TRUE(service.airQualityEnabled());
}

TEST(WeatherServiceTest, FetchesBothEndpointsAndCaches) {
  FakeApi api;
  api.bodies["weather"] = kCurrentJson;
  api.bodies["forecast"] = kForecastJson;
  WeatherService service(testConfig(), api.fetcher());

  EXPECT_FALSE(service.peekWeather().has_value());
  const auto bundle = service.weather();
  ASSERT_TRUE(bundle.has_value());
  EXPECT_EQ(bundle->current.description, "Light Rain");
  EXPECT_EQ(bundle->forecast.size(), 2u);
  EXPECT_EQ(api.requested.size(), 2u);

  ASSERT_TRUE(service.weather().has_value());
  EXPECT_EQ(api.requested.size(), 2u);
  EXPECT_TRUE(service.peekWeather().has_value());
}

TEST(WeatherServiceTest, FailedForecastCommitsNothing) {
  FakeApi api;
  api.bodies["weather"] = kCurrentJson;
  WeatherService service(testConfig(), api.fetcher());
  EXPECT_FALSE(service.weather().has_value());
  EXPECT_FALSE(service.peekWeather().has_value());
  EXPECT_EQ(service.weatherCache().entry().lastUpdatedMs, 0u);
}

TEST(WeatherServiceTest, FailedRefreshKeepsPreviousCommit) {
  FakeApi api;
  api.bodies["weather"] = kCurrentJson;
  api.bodies["forecast"] = kForecastJson;
  uint32_t nowMs = 5000;
  WeatherService service(testConfig(), api.fetcher(), [&nowMs] { return nowMs; });

  ASSERT_TRUE(service.weather().has_value());
  const TimedCache<WeatherBundle>::Entry before = service.weatherCache().entry();
  ASSERT_TRUE(before.value.has_value());
  EXPECT_EQ(before.lastUpdatedMs, 5000u);

  // Past the TTL, the current conditions still load but the forecast fails.
  nowMs += service.weatherCache().ttlMs() + 1;
  api.bodies["weather"] = R"({
    "weather": [{"description": "clear sky"}],
    "main": {"temp": 80.0, "feels_like": 80.0, "humidity": 10},
    "wind": {"speed": 1.0, "deg": 0}
  })";
  api.bodies.erase("forecast");
  const size_t requestsBefore = api.requested.size();

  const auto stale = service.weather();
  EXPECT_EQ(api.requested.size(), requestsBefore + 2);
  ASSERT_TRUE(stale.has_value());
  EXPECT_EQ(stale->current.description, "Light Rain");
  EXPECT_DOUBLE_EQ(stale->current.temperature, 61.5);

  const TimedCache<WeatherBundle>::Entry after = service.weatherCache().entry();
  EXPECT_EQ(after.lastUpdatedMs, before.lastUpdatedMs);
  ASSERT_TRUE(after.value.has_value());
  EXPECT_EQ(after.value->current.description, before.value->current.description);
  EXPECT_DOUBLE_EQ(after.value->current.temperature, before.value->current.temperature);
  EXPECT_EQ(after.value->forecast.size(), before.value->forecast.size());
  EXPECT_FALSE(service.weatherCache().isFresh());
}

TEST(WeatherServiceTest, AirQualityUsesItsOwnCache) {
  FakeApi api;
  api.bodies["air_pollution"] = kAirJson;
  WeatherService service(testConfig(), api.fetcher());
  const auto aq = service.airQuality();
  ASSERT_TRUE(aq.has_value());
  EXPECT_EQ(aq->aqi, 101);
  EXPECT_EQ(service.airQualityCache().ttlMs(), 1800u * 1000u);
  EXPECT_EQ(service.weatherCache().ttlMs(), 900u * 1000u);
  EXPECT_FALSE(service.peekWeather().has_value());
}
