#pragma once

#include <ctime>
#include <functional>
#include <string>

#include "core/NavBar.h"
#include "core/RenderScheduler.h"
#include "core/TimedCache.h"
#include "services/SolarCalc.h"

class ThemeState;
class WeatherService;
struct Palette;

// Everything the panels read. Built once in app_main and handed to the
// renderer; the renderer never owns the services.
struct PanelContext {
  NavBarLayout navBar;
  const SolarCalc* solar = nullptr;
  ThemeState* theme = nullptr;
  // Null when weather is disabled; panels then show "no data".
  WeatherService* weather = nullptr;
  std::string locationName;
  bool metricUnits = false;
  const bool* use24HourClock = nullptr;
  std::function<time_t()> wallClock;
};

class DefaultPanelRenderer : public PanelRenderer {
 public:
  explicit DefaultPanelRenderer(PanelContext ctx);

  bool render(const NavSnapshot& nav, Frame& frame) override;
  void renderFailure(const NavSnapshot& nav, Frame& frame) override;

 private:
  time_t now() const;
  bool use24Hour() const;
  int contentHeight() const { return ctx_.navBar.top(); }

  void drawClock(Frame& f, const Palette& p, time_t t);
  void drawAnalogClock(Frame& f, const Palette& p, time_t t);
  void drawWeather(Frame& f, const Palette& p);
  void drawAirQuality(Frame& f, const Palette& p);
  void drawSunPath(Frame& f, const Palette& p, time_t t);
  void drawDayLength(Frame& f, const Palette& p, time_t t);
  void drawSolar(Frame& f, const Palette& p, time_t t);
  void drawMoon(Frame& f, const Palette& p, time_t t);
  void drawAnalemma(Frame& f, const Palette& p, time_t t);
  void drawNavBar(Frame& f, const Palette& p, const NavSnapshot& nav);
  void drawTitle(Frame& f, const Palette& p, const char* title);
  void drawNoData(Frame& f, const Palette& p, const char* what);

  PanelContext ctx_;
  TimedCache<SolarSnapshot> solarCache_;
};
