#pragma once

#include <ctime>
#include <optional>
#include <vector>

struct SunTimes {
  time_t dawn = 0;
  time_t sunrise = 0;
  time_t noon = 0;
  time_t sunset = 0;
  time_t dusk = 0;
};

// Sunrise to 45 min after, and 45 min before sunset to sunset.
struct GoldenHours {
  time_t morningStart = 0;
  time_t morningEnd = 0;
  time_t eveningStart = 0;
  time_t eveningEnd = 0;
};

struct SolarPosition {
  double elevationDeg = 0.0;
  // Clockwise from north.
  double azimuthDeg = 0.0;
};

struct SolarEvent {
  const char* name = "";
  time_t at = 0;
};

// Sun at local solar noon on one sample day of the year.
struct AnalemmaPoint {
  int month = 1;
  int dayOfYear = 0;
  // Minutes the sun is ahead of the clock; negative when it is behind.
  double equationOfTimeMin = 0.0;
  double noonElevationDeg = 0.0;
};

// Everything the sun panels draw, computed in one pass.
struct SolarSnapshot {
  std::optional<SunTimes> today;
  std::optional<double> dayLengthS;
  std::optional<double> dayLengthChangeS;
  SolarPosition position;
  std::optional<SolarEvent> nextEvent;
  std::optional<GoldenHours> goldenHours;
  double equationOfTimeMin = 0.0;
  time_t computedAt = 0;
};

// NOAA low-precision solar model. Good to about a minute at mid latitudes.
class SolarCalc {
 public:
  SolarCalc(double latitude, double longitude);

  // Events of the local calendar day containing `when`. Empty during polar
  // day or night, when the sun never crosses the horizon.
  std::optional<SunTimes> sunTimes(time_t when) const;
  SolarPosition position(time_t when) const;
  std::optional<double> dayLengthS(time_t when) const;
  std::optional<SolarEvent> nextEvent(time_t now) const;
  std::optional<GoldenHours> goldenHours(time_t when) const;
  // Difference between 12:00 UTC and the sun's transit over Greenwich on
  // the UTC day containing `when`.
  static double equationOfTimeMin(time_t when);
  // Weekly samples from 1 January of `year`.
  std::vector<AnalemmaPoint> analemma(int year) const;
  SolarSnapshot snapshot(time_t now) const;

  double latitude() const { return latitude_; }
  double longitude() const { return longitude_; }

 private:
  std::optional<time_t> crossing(long daysSinceEpoch, double altitudeDeg, bool rising) const;
  time_t transit(long daysSinceEpoch) const;

  double latitude_;
  double longitude_;
};
