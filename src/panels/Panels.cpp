#include "panels/Panels.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <utility>
#include <vector>

#include "AppConfig.h"
#include "core/ThemeState.h"
#include "panels/PixelFont.h"
#include "panels/Theme.h"
#include "platform/Platform.h"
#include "services/LunarCalc.h"
#include "services/WeatherService.h"

using pixelfont::Align;

namespace {
constexpr const char* kTag = "panel";
constexpr double kPi = 3.14159265358979323846;
constexpr const char* kWeekdays[] = {"SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};
constexpr const char* kMonths[] = {"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                   "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};

struct tm localTm(time_t t) {
  struct tm out = {};
  localtime_r(&t, &out);
  return out;
}

time_t localMidnight(time_t t) {
  struct tm m = localTm(t);
  m.tm_hour = 0;
  m.tm_min = 0;
  m.tm_sec = 0;
  m.tm_isdst = -1;
  return mktime(&m);
}

std::string clockText(time_t t, bool use24h, const char** suffix) {
  const struct tm lt = localTm(t);
  char buf[16];
  if (use24h) {
    std::snprintf(buf, sizeof(buf), "%02d:%02d", lt.tm_hour, lt.tm_min);
    *suffix = "";
  } else {
    const int h12 = lt.tm_hour % 12 == 0 ? 12 : lt.tm_hour % 12;
    std::snprintf(buf, sizeof(buf), "%d:%02d", h12, lt.tm_min);
    *suffix = lt.tm_hour < 12 ? "AM" : "PM";
  }
  return buf;
}

std::string shortTime(time_t t, bool use24h) {
  const char* suffix = "";
  std::string s = clockText(t, use24h, &suffix);
  if (*suffix != '\0') {
    s += suffix[0];
  }
  return s;
}

std::string durationText(double seconds) {
  const long total = static_cast<long>(seconds + 0.5);
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%ldH %02ldM", total / 3600, (total % 3600) / 60);
  return buf;
}

std::string signedMinutesText(double seconds) {
  const double minutes = seconds / 60.0;
  char buf[24];
  std::snprintf(buf, sizeof(buf), "%+.1f MIN", minutes);
  return buf;
}

std::string fmt(const char* pattern, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), pattern, v);
  return buf;
}

// Analemma points by meteorological season.
uint16_t seasonColor(int month) {
  if (month >= 3 && month <= 5) {
    return rgb565(80, 200, 90);
  }
  if (month >= 6 && month <= 8) {
    return palette::sun();
  }
  if (month >= 9 && month <= 11) {
    return palette::sunset();
  }
  return palette::sky();
}

std::string weekdayFor(const std::string& isoDate) {
  struct tm d = {};
  if (std::sscanf(isoDate.c_str(), "%d-%d-%d", &d.tm_year, &d.tm_mon, &d.tm_mday) != 3) {
    return "---";
  }
  d.tm_year -= 1900;
  d.tm_mon -= 1;
  d.tm_hour = 12;
  d.tm_isdst = -1;
  if (mktime(&d) == static_cast<time_t>(-1)) {
    return "---";
  }
  return kWeekdays[d.tm_wday % 7];
}

}  // namespace

DefaultPanelRenderer::DefaultPanelRenderer(PanelContext ctx)
    : ctx_(std::move(ctx)),
      solarCache_("solar", AppConfig::kSolarCacheTtlMs, [this](SolarSnapshot& out) {
        if (ctx_.solar == nullptr) {
          return false;
        }
        out = ctx_.solar->snapshot(now());
        return true;
      }) {}

time_t DefaultPanelRenderer::now() const {
  return ctx_.wallClock ? ctx_.wallClock() : std::time(nullptr);
}

bool DefaultPanelRenderer::use24Hour() const {
  return ctx_.use24HourClock != nullptr && *ctx_.use24HourClock;
}

bool DefaultPanelRenderer::render(const NavSnapshot& nav, Frame& frame) {
  if (frame.width() != ctx_.navBar.screenWidth || frame.height() != ctx_.navBar.screenHeight) {
    platform::loge(kTag, "frame %ux%u does not match layout", frame.width(), frame.height());
    return false;
  }
  const bool daytime = ctx_.theme != nullptr ? ctx_.theme->isDaytime() : true;
  const bool forcedDay = ctx_.theme != nullptr && ctx_.theme->mode() == ThemeMode::kDay;
  const bool forcedNight = ctx_.theme != nullptr && ctx_.theme->mode() == ThemeMode::kNight;
  const Palette& p = palette::forDaytime(forcedDay || (!forcedNight && daytime));
  const time_t t = now();

  frame.fill(p.background);
  switch (nav.panel) {
    case PanelId::kClock:
      drawClock(frame, p, t);
      break;
    case PanelId::kWeather:
      drawWeather(frame, p);
      break;
    case PanelId::kAirQuality:
      drawAirQuality(frame, p);
      break;
    case PanelId::kSunPath:
      drawSunPath(frame, p, t);
      break;
    case PanelId::kDayLength:
      drawDayLength(frame, p, t);
      break;
    case PanelId::kSolar:
      drawSolar(frame, p, t);
      break;
    case PanelId::kMoon:
      drawMoon(frame, p, t);
      break;
    case PanelId::kAnalemma:
      drawAnalemma(frame, p, t);
      break;
    case PanelId::kAnalogClock:
      drawAnalogClock(frame, p, t);
      break;
  }
  drawNavBar(frame, p, nav);
  return true;
}

void DefaultPanelRenderer::renderFailure(const NavSnapshot& nav, Frame& frame) {
  const Palette& p = palette::night();
  frame.fill(p.background);
  const int cx = frame.width() / 2;
  pixelfont::drawText(frame, cx, contentHeight() / 2 - 20, "PANEL ERROR", 3, palette::alert(),
                      Align::kCenter);
  pixelfont::drawText(frame, cx, contentHeight() / 2 + 10, panelName(nav.panel), 2,
                      p.textSecondary, Align::kCenter);
  drawNavBar(frame, p, nav);
}

void DefaultPanelRenderer::drawTitle(Frame& f, const Palette& p, const char* title) {
  pixelfont::drawText(f, f.width() / 2, 6, title, 2, p.textSecondary, Align::kCenter);
  f.drawLine(10, 20, f.width() - 11, 20, p.divider);
}

void DefaultPanelRenderer::drawNoData(Frame& f, const Palette& p, const char* what) {
  const int cy = contentHeight() / 2;
  pixelfont::drawText(f, f.width() / 2, cy - 12, "NO DATA", 3, p.textTertiary, Align::kCenter);
  pixelfont::drawText(f, f.width() / 2, cy + 10, what, 1, p.textTertiary, Align::kCenter);
}

void DefaultPanelRenderer::drawClock(Frame& f, const Palette& p, time_t t) {
  const int w = f.width();
  f.fillRect(0, 0, w, 56, p.panel);

  const char* suffix = "";
  const std::string hhmm = clockText(t, use24Hour(), &suffix);
  const int timeScale = 8;
  const int timeW = pixelfont::textWidth(hhmm, timeScale);
  const int suffixW = *suffix != '\0' ? pixelfont::textWidth(suffix, 2) + 6 : 0;
  const int x0 = (w - timeW - suffixW) / 2;
  pixelfont::drawText(f, x0, 8, hhmm, timeScale, p.textPrimary);
  if (*suffix != '\0') {
    pixelfont::drawText(f, x0 + timeW + 6, 8, suffix, 2, p.textSecondary);
  }

  const struct tm lt = localTm(t);
  char date[32];
  std::snprintf(date, sizeof(date), "%s %s %d %d", kWeekdays[lt.tm_wday % 7],
                kMonths[lt.tm_mon % 12], lt.tm_mday, lt.tm_year + 1900);
  pixelfont::drawText(f, w / 2, 62, date, 2, p.textSecondary, Align::kCenter);

  // Sunrise, daylight and sunset row.
  const std::optional<SolarSnapshot> solar =
      ctx_.solar != nullptr ? solarCache_.get() : std::nullopt;
  const int rowY = 86;
  if (solar && solar->today) {
    pixelfont::drawText(f, 16, rowY, "SUNRISE", 1, p.textTertiary);
    pixelfont::drawText(f, 16, rowY + 9, shortTime(solar->today->sunrise, use24Hour()), 2,
                        palette::sun());
    pixelfont::drawText(f, w - 16, rowY, "SUNSET", 1, p.textTertiary, Align::kRight);
    pixelfont::drawText(f, w - 16, rowY + 9, shortTime(solar->today->sunset, use24Hour()), 2,
                        palette::sunset(), Align::kRight);
    if (solar->dayLengthS) {
      pixelfont::drawText(f, w / 2, rowY, "DAYLIGHT", 1, p.textTertiary, Align::kCenter);
      pixelfont::drawText(f, w / 2, rowY + 9, durationText(*solar->dayLengthS), 2, p.textPrimary,
                          Align::kCenter);
    }

    // Day progress between sunrise and sunset.
    const int barX = 16;
    const int barY = rowY + 30;
    const int barW = w - 32;
    f.drawRect(barX, barY, barW, 10, p.textTertiary);
    const double span = static_cast<double>(solar->today->sunset - solar->today->sunrise);
    double progress = span > 0 ? (t - solar->today->sunrise) / span : 0.0;
    progress = std::min(1.0, std::max(0.0, progress));
    f.fillRect(barX + 1, barY + 1, static_cast<int>((barW - 2) * progress), 8, palette::sun());
    if (solar->nextEvent) {
      const long mins = static_cast<long>((solar->nextEvent->at - t) / 60);
      char next[40];
      std::snprintf(next, sizeof(next), "%s IN %ldH %02ldM", solar->nextEvent->name, mins / 60,
                    mins % 60);
      pixelfont::drawText(f, w / 2, barY + 14, next, 1, p.textSecondary, Align::kCenter);
    }
  } else {
    pixelfont::drawText(f, w / 2, rowY + 8, "NO SUNRISE TODAY", 2, p.textTertiary,
                        Align::kCenter);
  }

  // Current conditions, if any.
  const int wxY = 150;
  const std::optional<WeatherBundle> wx =
      ctx_.weather != nullptr ? ctx_.weather->peekWeather() : std::nullopt;
  if (wx) {
    const char* unit = ctx_.metricUnits ? "*C" : "*F";
    pixelfont::drawText(f, 16, wxY, fmt("%.0f", wx->current.temperature) + unit, 4,
                        palette::sun());
    pixelfont::drawText(f, w - 16, wxY + 2, wx->current.description, 2, p.textPrimary,
                        Align::kRight);
    pixelfont::drawText(f, w - 16, wxY + 16,
                        "HUMIDITY " + std::to_string(wx->current.humidity) + "%", 1,
                        p.textSecondary, Align::kRight);
  } else {
    pixelfont::drawText(f, w / 2, wxY + 6, "WEATHER UNAVAILABLE", 1, p.textTertiary,
                        Align::kCenter);
  }
}

void DefaultPanelRenderer::drawAnalogClock(Frame& f, const Palette& p, time_t t) {
  const int cx = f.width() / 2;
  const int cy = contentHeight() / 2;
  const int r = std::min(cx, cy) - 8;
  f.fillCircle(cx, cy, r, p.clockFace);
  f.drawCircle(cx, cy, r, p.clockMarkers);

  for (int i = 0; i < 60; ++i) {
    const double a = i * kPi / 30.0;
    const int inner = (i % 5 == 0) ? r - 12 : r - 5;
    const int x0 = cx + static_cast<int>(std::sin(a) * inner);
    const int y0 = cy - static_cast<int>(std::cos(a) * inner);
    const int x1 = cx + static_cast<int>(std::sin(a) * (r - 2));
    const int y1 = cy - static_cast<int>(std::cos(a) * (r - 2));
    f.drawThickLine(x0, y0, x1, y1, (i % 5 == 0) ? 3 : 1, p.clockMarkers);
  }

  const struct tm lt = localTm(t);
  const double secA = lt.tm_sec * kPi / 30.0;
  const double minA = (lt.tm_min + lt.tm_sec / 60.0) * kPi / 30.0;
  const double hourA = ((lt.tm_hour % 12) + lt.tm_min / 60.0) * kPi / 6.0;

  auto hand = [&](double angle, double length, int thickness, uint16_t color) {
    const int x = cx + static_cast<int>(std::sin(angle) * length);
    const int y = cy - static_cast<int>(std::cos(angle) * length);
    f.drawThickLine(cx, cy, x, y, thickness, color);
  };
  hand(hourA, r * 0.5, 5, p.clockHands);
  hand(minA, r * 0.75, 3, p.clockHands);
  hand(secA, r * 0.85, 1, palette::alert());
  f.fillCircle(cx, cy, 4, palette::alert());
}

void DefaultPanelRenderer::drawWeather(Frame& f, const Palette& p) {
  drawTitle(f, p, ctx_.locationName.empty() ? "WEATHER" : ctx_.locationName.c_str());
  const std::optional<WeatherBundle> wx =
      ctx_.weather != nullptr ? ctx_.weather->peekWeather() : std::nullopt;
  if (!wx) {
    drawNoData(f, p, ctx_.weather == nullptr ? "WEATHER DISABLED" : "WAITING FOR FORECAST");
    return;
  }
  const int w = f.width();
  const CurrentWeather& cur = wx->current;
  const char* unit = ctx_.metricUnits ? "*C" : "*F";
  const char* speedUnit = ctx_.metricUnits ? "M/S" : "MPH";

  pixelfont::drawText(f, 16, 30, fmt("%.0f", cur.temperature) + unit, 7, palette::sun());
  pixelfont::drawText(f, w - 16, 30, cur.description, 2, p.textPrimary, Align::kRight);
  pixelfont::drawText(f, w - 16, 46, "FEELS " + fmt("%.0f", cur.feelsLike) + unit, 1,
                      p.textSecondary, Align::kRight);
  pixelfont::drawText(f, w - 16, 56, "HUMIDITY " + std::to_string(cur.humidity) + "%", 1,
                      p.textSecondary, Align::kRight);
  pixelfont::drawText(f, w - 16, 66,
                      "WIND " + fmt("%.0f", cur.windSpeed) + " " + speedUnit + " " +
                          cur.windDirection,
                      1, p.textSecondary, Align::kRight);

  f.drawLine(10, 80, w - 11, 80, p.divider);
  const size_t days = wx->forecast.size();
  if (days == 0) {
    pixelfont::drawText(f, w / 2, 120, "NO FORECAST", 2, p.textTertiary, Align::kCenter);
    return;
  }
  const int colW = (w - 20) / static_cast<int>(days);
  for (size_t i = 0; i < days; ++i) {
    const DailyForecast& d = wx->forecast[i];
    const int cx = 10 + colW * static_cast<int>(i) + colW / 2;
    f.fillRect(cx - colW / 2 + 3, 86, colW - 6, 104, p.panel);
    pixelfont::drawText(f, cx, 92, weekdayFor(d.date), 2, p.textPrimary, Align::kCenter);
    pixelfont::drawText(f, cx, 112, fmt("%.0f*", d.high), 2, palette::sunset(), Align::kCenter);
    pixelfont::drawText(f, cx, 132, fmt("%.0f*", d.low), 2, palette::sky(), Align::kCenter);
    pixelfont::drawText(f, cx, 158, "RAIN", 1, p.textTertiary, Align::kCenter);
    pixelfont::drawText(f, cx, 168, std::to_string(d.rainChancePct) + "%", 2, p.textSecondary,
                        Align::kCenter);
  }
}

void DefaultPanelRenderer::drawAirQuality(Frame& f, const Palette& p) {
  drawTitle(f, p, "AIR QUALITY");
  const std::optional<AirQuality> aq =
      ctx_.weather != nullptr ? ctx_.weather->peekAirQuality() : std::nullopt;
  if (!aq) {
    drawNoData(f, p, ctx_.weather == nullptr ? "AIR QUALITY DISABLED" : "WAITING FOR READINGS");
    return;
  }
  const int w = f.width();
  const uint16_t color = palette::aqiColor(aq->aqi);
  f.fillRect(16, 30, 120, 80, color);
  pixelfont::drawText(f, 76, 44, std::to_string(aq->aqi), 7, rgb565(0, 0, 0), Align::kCenter);
  pixelfont::drawText(f, 76, 96, "US AQI", 1, rgb565(0, 0, 0), Align::kCenter);
  pixelfont::drawText(f, 150, 40, aq->category, 2, p.textPrimary);

  // Scale bar with the current reading marked.
  const int barX = 150;
  const int barW = w - barX - 16;
  const int stops[] = {50, 100, 150, 200, 300, 500};
  int prev = 0;
  for (int stop : stops) {
    const int x0 = barX + barW * prev / 500;
    const int x1 = barX + barW * stop / 500;
    f.fillRect(x0, 70, std::max(1, x1 - x0), 10, palette::aqiColor(stop));
    prev = stop;
  }
  const int marker = barX + barW * std::min(aq->aqi, 500) / 500;
  f.fillRect(marker - 1, 64, 3, 22, p.textPrimary);

  struct Row {
    const char* label;
    double value;
  };
  const Row rows[] = {{"PM2.5", aq->pm25}, {"PM10", aq->pm10}, {"O3", aq->o3},
                      {"NO2", aq->no2},    {"SO2", aq->so2},   {"CO", aq->co}};
  for (size_t i = 0; i < sizeof(rows) / sizeof(rows[0]); ++i) {
    const int col = static_cast<int>(i % 3);
    const int line = static_cast<int>(i / 3);
    const int x = 16 + col * ((w - 32) / 3);
    const int y = 122 + line * 36;
    pixelfont::drawText(f, x, y, rows[i].label, 1, p.textTertiary);
    pixelfont::drawText(f, x, y + 10, fmt("%.1f", rows[i].value), 2, p.textPrimary);
  }
}

void DefaultPanelRenderer::drawSunPath(Frame& f, const Palette& p, time_t t) {
  drawTitle(f, p, "SUN PATH");
  if (ctx_.solar == nullptr) {
    drawNoData(f, p, "LOCATION NOT SET");
    return;
  }
  const int w = f.width();
  const int chartTop = 28;
  const int chartBottom = 130;
  const double maxElev = 90.0;
  const double minElev = -30.0;
  auto yFor = [&](double elev) {
    const double clamped = std::max(minElev, std::min(maxElev, elev));
    return chartBottom -
           static_cast<int>((clamped - minElev) / (maxElev - minElev) * (chartBottom - chartTop));
  };
  const int horizonY = yFor(0.0);
  f.drawLine(8, horizonY, w - 9, horizonY, p.textTertiary);
  pixelfont::drawText(f, 8, horizonY - 7, "0*", 1, p.textTertiary);

  const time_t midnight = localMidnight(t);
  const int plotW = w - 16;
  int prevX = -1;
  int prevY = 0;
  for (int minute = 0; minute <= 1440; minute += 15) {
    const double elev = ctx_.solar->position(midnight + minute * 60).elevationDeg;
    const int x = 8 + plotW * minute / 1440;
    const int y = yFor(elev);
    if (prevX >= 0) {
      f.drawThickLine(prevX, prevY, x, y, 2, elev >= 0.0 ? palette::sun() : palette::nightSky());
    }
    prevX = x;
    prevY = y;
  }

  const SolarPosition pos = ctx_.solar->position(t);
  const int sunX = 8 + plotW * static_cast<int>((t - midnight) / 60) / 1440;
  f.fillCircle(sunX, yFor(pos.elevationDeg), 6, pos.elevationDeg >= 0.0 ? palette::sun()
                                                                          : p.textTertiary);

  const std::optional<SolarSnapshot> snap = solarCache_.get();
  f.fillRect(8, 140, w / 2 - 12, 52, p.panel);
  f.fillRect(w / 2 + 4, 140, w / 2 - 12, 52, p.panel);
  if (snap && snap->nextEvent) {
    pixelfont::drawText(f, 14, 146, snap->nextEvent->name, 2, palette::sunset());
    pixelfont::drawText(f, 14, 166, shortTime(snap->nextEvent->at, use24Hour()), 2,
                        p.textPrimary);
  } else {
    pixelfont::drawText(f, 14, 156, "NO EVENTS", 2, p.textTertiary);
  }
  pixelfont::drawText(f, w / 2 + 10, 146, "ELEV " + fmt("%.1f*", pos.elevationDeg), 2,
                      palette::sun());
  pixelfont::drawText(f, w / 2 + 10, 166, "AZ " + fmt("%.0f*", pos.azimuthDeg) + " " +
                                              weather::degreesToCompass(pos.azimuthDeg),
                      2, p.textSecondary);
}

void DefaultPanelRenderer::drawDayLength(Frame& f, const Palette& p, time_t t) {
  drawTitle(f, p, "DAY LENGTH");
  if (ctx_.solar == nullptr) {
    drawNoData(f, p, "LOCATION NOT SET");
    return;
  }
  const int w = f.width();
  const int chartTop = 28;
  const int chartBottom = 120;
  const int plotX = 24;
  const int plotW = w - plotX - 8;
  auto yFor = [&](double seconds) {
    const double hours = std::max(0.0, std::min(24.0, seconds / 3600.0));
    return chartBottom - static_cast<int>(hours / 24.0 * (chartBottom - chartTop));
  };
  pixelfont::drawText(f, 2, yFor(12 * 3600.0) - 2, "12H", 1, p.textTertiary);
  f.drawLine(plotX, yFor(12 * 3600.0), w - 9, yFor(12 * 3600.0), p.divider);

  struct tm jan1 = localTm(t);
  const int yday = jan1.tm_yday;
  jan1.tm_mon = 0;
  jan1.tm_mday = 1;
  jan1.tm_hour = 12;
  jan1.tm_min = 0;
  jan1.tm_sec = 0;
  jan1.tm_isdst = -1;
  const time_t yearStart = mktime(&jan1);

  int prevX = -1;
  int prevY = 0;
  for (int day = 0; day <= 365; day += 5) {
    const time_t when = yearStart + static_cast<time_t>(day) * 86400;
    const std::optional<double> len = ctx_.solar->dayLengthS(when);
    const double seconds = len ? *len : (ctx_.solar->position(when).elevationDeg > 0 ? 86400.0 : 0.0);
    const int x = plotX + plotW * day / 365;
    const int y = yFor(seconds);
    if (prevX >= 0) {
      f.drawThickLine(prevX, prevY, x, y, 2, palette::sunset());
    }
    prevX = x;
    prevY = y;
  }

  const std::optional<SolarSnapshot> snap = solarCache_.get();
  const int todayX = plotX + plotW * yday / 365;
  if (snap && snap->dayLengthS) {
    f.fillCircle(todayX, yFor(*snap->dayLengthS), 4, palette::sun());
  } else {
    f.drawLine(todayX, chartTop, todayX, chartBottom, palette::sun());
  }

  const int boxW = (w - 24) / 3;
  for (int i = 0; i < 3; ++i) {
    f.fillRect(8 + i * (boxW + 4), 130, boxW, 62, p.panel);
  }
  pixelfont::drawText(f, 14, 136, "TODAY", 1, p.textTertiary);
  pixelfont::drawText(f, 14, 150, snap && snap->dayLengthS ? durationText(*snap->dayLengthS) : "--",
                      2, p.textPrimary);
  if (snap && snap->dayLengthChangeS) {
    const uint16_t color = *snap->dayLengthChangeS >= 0 ? palette::sun() : palette::sky();
    pixelfont::drawText(f, 14, 172, signedMinutesText(*snap->dayLengthChangeS), 1, color);
  }

  const int x2 = 8 + boxW + 4 + 6;
  pixelfont::drawText(f, x2, 136, "SUNRISE/SUNSET", 1, p.textTertiary);
  if (snap && snap->today) {
    pixelfont::drawText(f, x2, 150, shortTime(snap->today->sunrise, use24Hour()), 2,
                        palette::sun());
    pixelfont::drawText(f, x2, 170, shortTime(snap->today->sunset, use24Hour()), 2,
                        palette::sunset());
  } else {
    pixelfont::drawText(f, x2, 156, "--", 2, p.textTertiary);
  }

  const int x3 = 8 + 2 * (boxW + 4) + 6;
  pixelfont::drawText(f, x3, 136, "NEXT", 1, p.textTertiary);
  if (snap && snap->nextEvent) {
    pixelfont::drawText(f, x3, 150, snap->nextEvent->name, 2, palette::sunset());
    pixelfont::drawText(f, x3, 170, shortTime(snap->nextEvent->at, use24Hour()), 2,
                        p.textPrimary);
  } else {
    pixelfont::drawText(f, x3, 156, "--", 2, p.textTertiary);
  }
}

void DefaultPanelRenderer::drawSolar(Frame& f, const Palette& p, time_t t) {
  drawTitle(f, p, "SOLAR DETAILS");
  if (ctx_.solar == nullptr) {
    drawNoData(f, p, "LOCATION NOT SET");
    return;
  }
  const int w = f.width();
  const std::optional<SolarSnapshot> snap = solarCache_.get();
  const bool haveTimes = snap && snap->today;

  struct Event {
    const char* label;
    time_t at;
    uint16_t color;
    int x;
    int y;
  };
  if (haveTimes) {
    const SunTimes& st = *snap->today;
    const int col2 = w / 2 + 10;
    const Event events[] = {{"DAWN", st.dawn, p.textSecondary, 16, 28},
                            {"SUNRISE", st.sunrise, palette::sun(), 16, 52},
                            {"SOLAR NOON", st.noon, p.textSecondary, 16, 76},
                            {"SUNSET", st.sunset, palette::sun(), col2, 28},
                            {"DUSK", st.dusk, palette::sunset(), col2, 52}};
    for (const Event& ev : events) {
      pixelfont::drawText(f, ev.x, ev.y, ev.label, 1, p.textTertiary);
      pixelfont::drawText(f, ev.x, ev.y + 9, shortTime(ev.at, use24Hour()), 2, ev.color);
    }
  } else {
    pixelfont::drawText(f, w / 2, 56, "NO SUNRISE TODAY", 2, p.textTertiary, Align::kCenter);
  }

  pixelfont::drawText(f, 16, 102, "GOLDEN HOUR", 1, palette::sunset());
  if (snap && snap->goldenHours) {
    const GoldenHours& g = *snap->goldenHours;
    pixelfont::drawText(f, 16, 114,
                        shortTime(g.morningStart, use24Hour()) + "-" +
                            shortTime(g.morningEnd, use24Hour()),
                        2, palette::sun());
    pixelfont::drawText(f, w / 2 + 10, 114,
                        shortTime(g.eveningStart, use24Hour()) + "-" +
                            shortTime(g.eveningEnd, use24Hour()),
                        2, palette::sunset());
  } else {
    pixelfont::drawText(f, 16, 114, "--", 2, p.textTertiary);
  }

  const int boxW = (w - 24) / 3;
  for (int i = 0; i < 3; ++i) {
    f.fillRect(8 + i * (boxW + 4), 138, boxW, 54, p.panel);
  }
  const SolarPosition pos = snap ? snap->position : ctx_.solar->position(t);
  pixelfont::drawText(f, 14, 143, "SUN POSITION", 1, p.textTertiary);
  pixelfont::drawText(f, 14, 156, "EL " + fmt("%.1f*", pos.elevationDeg), 2, palette::sun());
  pixelfont::drawText(f, 14, 176, "AZ " + fmt("%.0f*", pos.azimuthDeg), 1, p.textSecondary);

  const int x2 = 8 + boxW + 4 + 6;
  pixelfont::drawText(f, x2, 143, "DAY LENGTH", 1, p.textTertiary);
  pixelfont::drawText(f, x2, 156, snap && snap->dayLengthS ? durationText(*snap->dayLengthS) : "--",
                      2, p.textPrimary);
  if (snap && snap->dayLengthChangeS) {
    const uint16_t color = *snap->dayLengthChangeS >= 0 ? palette::sun() : palette::sky();
    pixelfont::drawText(f, x2, 176, signedMinutesText(*snap->dayLengthChangeS), 1, color);
  }

  const int x3 = 8 + 2 * (boxW + 4) + 6;
  pixelfont::drawText(f, x3, 143, "NEXT EVENT", 1, p.textTertiary);
  // An event already behind us means the cache is about to refresh.
  if (snap && snap->nextEvent && snap->nextEvent->at >= t) {
    const long mins = static_cast<long>((snap->nextEvent->at - t) / 60);
    char in[24];
    std::snprintf(in, sizeof(in), "IN %ldH %02ldM", mins / 60, mins % 60);
    pixelfont::drawText(f, x3, 156, snap->nextEvent->name, 2, palette::sunset());
    pixelfont::drawText(f, x3, 176, in, 1, p.textSecondary);
  } else {
    pixelfont::drawText(f, x3, 156, "--", 2, p.textTertiary);
  }
}

void DefaultPanelRenderer::drawMoon(Frame& f, const Palette& p, time_t t) {
  drawTitle(f, p, "MOON");
  const MoonInfo moon = lunar::moonInfo(t);
  const int cx = 80;
  const int cy = 100;
  const int r = 56;

  // Row-by-row terminator: waxing lights the right limb, waning the left.
  const double c = std::cos(2.0 * kPi * moon.phase);
  for (int dy = -r; dy <= r; ++dy) {
    const double half = std::sqrt(static_cast<double>(r * r - dy * dy));
    f.drawLine(cx - static_cast<int>(half), cy + dy, cx + static_cast<int>(half), cy + dy,
               palette::moonShadow());
    double from = 0.0;
    double to = 0.0;
    if (moon.phase < 0.5) {
      from = half * c;
      to = half;
    } else {
      from = -half;
      to = -half * c;
    }
    if (to > from) {
      f.drawLine(cx + static_cast<int>(std::lround(from)), cy + dy,
                 cx + static_cast<int>(std::lround(to)), cy + dy, palette::moonLight());
    }
  }
  f.drawCircle(cx, cy, r, p.textTertiary);

  const int tx = 160;
  pixelfont::drawText(f, tx, 40, moon.phaseName, 2, p.textPrimary);
  pixelfont::drawText(f, tx, 62, fmt("%.0f%% LIT", moon.illuminationPct), 2, palette::sun());
  pixelfont::drawText(f, tx, 90, "AGE " + fmt("%.1f DAYS", moon.ageDays), 1, p.textSecondary);
  pixelfont::drawText(f, tx, 110, "FULL IN " + fmt("%.1f DAYS", moon.daysToFull), 1,
                      p.textSecondary);
  pixelfont::drawText(f, tx, 124, "NEW IN " + fmt("%.1f DAYS", moon.daysToNew), 1,
                      p.textSecondary);
}

void DefaultPanelRenderer::drawAnalemma(Frame& f, const Palette& p, time_t t) {
  drawTitle(f, p, "ANALEMMA");
  if (ctx_.solar == nullptr) {
    drawNoData(f, p, "LOCATION NOT SET");
    return;
  }
  const struct tm lt = localTm(t);
  const std::vector<AnalemmaPoint> points = ctx_.solar->analemma(lt.tm_year + 1900);

  // Sun early plots right of the axis, late plots left.
  const int cx = 96;
  const int top = 34;
  const int bottom = 186;
  const double halfW = 76.0;
  const double maxEotMin = 17.0;
  double highest = -90.0;
  double lowest = 90.0;
  for (const AnalemmaPoint& point : points) {
    highest = std::max(highest, point.noonElevationDeg);
    lowest = std::min(lowest, point.noonElevationDeg);
  }
  const double span = std::max(1.0, highest - lowest);
  auto xFor = [&](double eot) { return cx + static_cast<int>(eot / maxEotMin * halfW); };
  auto yFor = [&](double elev) {
    return bottom - static_cast<int>((elev - lowest) / span * (bottom - top));
  };

  f.drawLine(cx, top - 6, cx, bottom + 6, p.divider);
  f.drawLine(cx - static_cast<int>(halfW), (top + bottom) / 2, cx + static_cast<int>(halfW),
             (top + bottom) / 2, p.divider);
  pixelfont::drawText(f, cx - static_cast<int>(halfW), (top + bottom) / 2 + 4, "LATE", 1,
                      p.textTertiary);
  pixelfont::drawText(f, cx + static_cast<int>(halfW), (top + bottom) / 2 + 4, "EARLY", 1,
                      p.textTertiary, Align::kRight);

  const AnalemmaPoint* today = nullptr;
  for (const AnalemmaPoint& point : points) {
    f.fillCircle(xFor(point.equationOfTimeMin), yFor(point.noonElevationDeg), 2,
                 seasonColor(point.month));
    if (std::abs(point.dayOfYear - lt.tm_yday) < 7) {
      today = &point;
    }
  }
  if (today != nullptr) {
    const int x = xFor(today->equationOfTimeMin);
    const int y = yFor(today->noonElevationDeg);
    f.drawCircle(x, y, 6, palette::sun());
    f.fillCircle(x, y, 3, p.textPrimary);
  }

  const int bx = 190;
  const int bw = f.width() - bx - 8;
  f.fillRect(bx, 28, bw, 62, p.panel);
  const double eot = SolarCalc::equationOfTimeMin(t);
  pixelfont::drawText(f, bx + 6, 33, "TODAY SUN IS", 1, p.textTertiary);
  pixelfont::drawText(f, bx + 6, 46, fmt("%.1f MIN", std::fabs(eot)), 2, palette::sun());
  pixelfont::drawText(f, bx + 6, 68, eot >= 0.0 ? "EARLY" : "LATE", 2, p.textSecondary);

  f.fillRect(bx, 96, bw, 56, p.panel);
  const SolarPosition pos = ctx_.solar->position(t);
  pixelfont::drawText(f, bx + 6, 101, "SUN PATH", 1, p.textTertiary);
  pixelfont::drawText(f, bx + 6, 114, pos.elevationDeg > 45.0 ? "HIGH" : "LOW", 2,
                      palette::sun());
  pixelfont::drawText(f, bx + 6, 136, "EL " + fmt("%.1f*", pos.elevationDeg), 1,
                      p.textSecondary);

  struct Legend {
    const char* label;
    int month;
  };
  const Legend legend[] = {{"SP", 4}, {"SU", 7}, {"FA", 10}, {"WI", 1}};
  for (size_t i = 0; i < sizeof(legend) / sizeof(legend[0]); ++i) {
    const int x = bx + static_cast<int>(i) * 30;
    f.fillCircle(x + 4, 166, 3, seasonColor(legend[i].month));
    pixelfont::drawText(f, x + 10, 164, legend[i].label, 1, p.textSecondary);
  }
}

void DefaultPanelRenderer::drawNavBar(Frame& f, const Palette& p, const NavSnapshot& nav) {
  const NavBarLayout& lay = ctx_.navBar;
  const UiRect bar = lay.bar();
  f.fillRect(bar.x, bar.y, bar.w, bar.h, p.navBackground);
  f.drawLine(bar.x, bar.y, bar.x + bar.w - 1, bar.y, p.divider);

  const UiRect prevBtn = lay.prevButton();
  const UiRect nextBtn = lay.nextButton();
  f.fillRect(prevBtn.x, prevBtn.y, prevBtn.w, prevBtn.h, p.navButton);
  f.fillRect(nextBtn.x, nextBtn.y, nextBtn.w, nextBtn.h, p.navButton);
  const int labelY = prevBtn.y + (prevBtn.h - pixelfont::textHeight(3)) / 2;
  pixelfont::drawText(f, prevBtn.x + prevBtn.w / 2, labelY, "<", 3, p.textPrimary,
                      Align::kCenter);
  pixelfont::drawText(f, nextBtn.x + nextBtn.w / 2, labelY, ">", 3, p.textPrimary,
                      Align::kCenter);

  if (nav.count == 0) {
    return;
  }
  const int spacing = 14;
  const int dotsW = spacing * (static_cast<int>(nav.count) - 1);
  const int startX = bar.x + bar.w / 2 - dotsW / 2;
  const int dotY = bar.y + bar.h / 2;
  for (size_t i = 0; i < nav.count; ++i) {
    const int x = startX + spacing * static_cast<int>(i);
    if (i == nav.index) {
      f.fillCircle(x, dotY, 4, p.navDotActive);
    } else {
      f.fillCircle(x, dotY, 3, p.navDotInactive);
    }
  }
}
