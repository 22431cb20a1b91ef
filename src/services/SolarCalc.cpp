#include "services/SolarCalc.h"

#include <cmath>

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kDeg = kPi / 180.0;
constexpr double kJulianUnixEpoch = 2440587.5;
constexpr double kJ2000 = 2451545.0;
constexpr long kDaysToJ2000 = 10957;
constexpr double kSunriseAltitude = -0.833;
constexpr double kCivilTwilightAltitude = -6.0;
constexpr long kSecondsPerDay = 86400;
constexpr time_t kGoldenHourS = 45 * 60;
constexpr int kAnalemmaStepDays = 7;

double normalizeDegrees(double deg) {
  double v = std::fmod(deg, 360.0);
  return v < 0.0 ? v + 360.0 : v;
}

time_t julianToUnix(double jd) {
  return static_cast<time_t>(std::llround((jd - kJulianUnixEpoch) * kSecondsPerDay));
}

// Howard Hinnant's days_from_civil.
long daysFromCivil(int y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<long>(era) * 146097 + static_cast<long>(doe) - 719468;
}

// Days since 1970-01-01 of the local calendar date containing `when`.
long localDaysSinceEpoch(time_t when) {
  struct tm local = {};
  localtime_r(&when, &local);
  return daysFromCivil(local.tm_year + 1900, static_cast<unsigned>(local.tm_mon + 1),
                       static_cast<unsigned>(local.tm_mday));
}

int monthOfDay(long daysSinceEpoch) {
  const time_t at = static_cast<time_t>(daysSinceEpoch) * kSecondsPerDay;
  struct tm utc = {};
  gmtime_r(&at, &utc);
  return utc.tm_mon + 1;
}

struct SolarDay {
  double transitJd = 0.0;
  double declination = 0.0;
};

SolarDay solarDay(long daysSinceEpoch, double longitude) {
  const double n = static_cast<double>(daysSinceEpoch - kDaysToJ2000);
  const double jStar = n - longitude / 360.0;
  const double m = normalizeDegrees(357.5291 + 0.98560028 * jStar);
  const double c = 1.9148 * std::sin(m * kDeg) + 0.0200 * std::sin(2 * m * kDeg) +
                   0.0003 * std::sin(3 * m * kDeg);
  const double lambda = normalizeDegrees(m + c + 180.0 + 102.9372);
  SolarDay day;
  day.transitJd =
      kJ2000 + jStar + 0.0053 * std::sin(m * kDeg) - 0.0069 * std::sin(2 * lambda * kDeg);
  day.declination = std::asin(std::sin(lambda * kDeg) * std::sin(23.4397 * kDeg));
  return day;
}
}  // namespace

SolarCalc::SolarCalc(double latitude, double longitude)
    : latitude_(latitude), longitude_(longitude) {}

time_t SolarCalc::transit(long daysSinceEpoch) const {
  return julianToUnix(solarDay(daysSinceEpoch, longitude_).transitJd);
}

std::optional<time_t> SolarCalc::crossing(long daysSinceEpoch, double altitudeDeg,
                                          bool rising) const {
  const SolarDay day = solarDay(daysSinceEpoch, longitude_);
  const double phi = latitude_ * kDeg;
  const double cosOmega = (std::sin(altitudeDeg * kDeg) - std::sin(phi) * std::sin(day.declination)) /
                          (std::cos(phi) * std::cos(day.declination));
  if (cosOmega < -1.0 || cosOmega > 1.0) {
    return std::nullopt;
  }
  const double omegaDeg = std::acos(cosOmega) / kDeg;
  const double jd = rising ? day.transitJd - omegaDeg / 360.0 : day.transitJd + omegaDeg / 360.0;
  return julianToUnix(jd);
}

std::optional<SunTimes> SolarCalc::sunTimes(time_t when) const {
  const long day = localDaysSinceEpoch(when);
  const auto sunrise = crossing(day, kSunriseAltitude, true);
  const auto sunset = crossing(day, kSunriseAltitude, false);
  if (!sunrise || !sunset) {
    return std::nullopt;
  }
  SunTimes times;
  times.sunrise = *sunrise;
  times.sunset = *sunset;
  times.noon = transit(day);
  // Twilight can be missing near the poles in summer; clamp to the horizon
  // crossing.
  times.dawn = crossing(day, kCivilTwilightAltitude, true).value_or(*sunrise);
  times.dusk = crossing(day, kCivilTwilightAltitude, false).value_or(*sunset);
  return times;
}

SolarPosition SolarCalc::position(time_t when) const {
  const double d = static_cast<double>(when) / kSecondsPerDay + kJulianUnixEpoch - kJ2000;
  const double g = normalizeDegrees(357.529 + 0.98560028 * d) * kDeg;
  const double q = normalizeDegrees(280.459 + 0.98564736 * d);
  const double l = normalizeDegrees(q + 1.915 * std::sin(g) + 0.020 * std::sin(2 * g)) * kDeg;
  const double e = (23.439 - 0.00000036 * d) * kDeg;
  const double ra = std::atan2(std::cos(e) * std::sin(l), std::cos(l));
  const double dec = std::asin(std::sin(e) * std::sin(l));
  const double gmstHours = std::fmod(18.697374558 + 24.06570982441908 * d, 24.0);
  const double hourAngle = normalizeDegrees(gmstHours * 15.0 + longitude_ - ra / kDeg) * kDeg;
  const double phi = latitude_ * kDeg;

  SolarPosition pos;
  pos.elevationDeg =
      std::asin(std::sin(phi) * std::sin(dec) + std::cos(phi) * std::cos(dec) * std::cos(hourAngle)) /
      kDeg;
  const double az = std::atan2(-std::sin(hourAngle),
                               std::tan(dec) * std::cos(phi) - std::sin(phi) * std::cos(hourAngle));
  pos.azimuthDeg = normalizeDegrees(az / kDeg);
  return pos;
}

std::optional<double> SolarCalc::dayLengthS(time_t when) const {
  const auto times = sunTimes(when);
  if (!times) {
    return std::nullopt;
  }
  return static_cast<double>(times->sunset - times->sunrise);
}

std::optional<SolarEvent> SolarCalc::nextEvent(time_t now) const {
  const auto today = sunTimes(now);
  if (today) {
    const SolarEvent events[] = {{"Dawn", today->dawn},
                                 {"Sunrise", today->sunrise},
                                 {"Sunset", today->sunset},
                                 {"Dusk", today->dusk}};
    for (const SolarEvent& ev : events) {
      if (ev.at > now) {
        return ev;
      }
    }
  }
  const auto tomorrow = sunTimes(now + kSecondsPerDay);
  if (tomorrow) {
    return SolarEvent{"Dawn", tomorrow->dawn};
  }
  return std::nullopt;
}

std::optional<GoldenHours> SolarCalc::goldenHours(time_t when) const {
  const auto times = sunTimes(when);
  if (!times) {
    return std::nullopt;
  }
  GoldenHours golden;
  golden.morningStart = times->sunrise;
  golden.morningEnd = times->sunrise + kGoldenHourS;
  golden.eveningStart = times->sunset - kGoldenHourS;
  golden.eveningEnd = times->sunset;
  return golden;
}

double SolarCalc::equationOfTimeMin(time_t when) {
  const long day = static_cast<long>(std::floor(static_cast<double>(when) / kSecondsPerDay));
  const double transitS = (solarDay(day, 0.0).transitJd - kJulianUnixEpoch) * kSecondsPerDay;
  const double noonUtcS = static_cast<double>(day) * kSecondsPerDay + kSecondsPerDay / 2;
  return (noonUtcS - transitS) / 60.0;
}

std::vector<AnalemmaPoint> SolarCalc::analemma(int year) const {
  std::vector<AnalemmaPoint> points;
  const long first = daysFromCivil(year, 1, 1);
  const long last = daysFromCivil(year + 1, 1, 1);
  for (long day = first; day < last; day += kAnalemmaStepDays) {
    AnalemmaPoint point;
    point.month = monthOfDay(day);
    point.dayOfYear = static_cast<int>(day - first);
    point.equationOfTimeMin = equationOfTimeMin(static_cast<time_t>(day) * kSecondsPerDay);
    point.noonElevationDeg = position(transit(day)).elevationDeg;
    points.push_back(point);
  }
  return points;
}

SolarSnapshot SolarCalc::snapshot(time_t now) const {
  SolarSnapshot snap;
  snap.computedAt = now;
  snap.today = sunTimes(now);
  snap.position = position(now);
  snap.nextEvent = nextEvent(now);
  snap.goldenHours = goldenHours(now);
  snap.equationOfTimeMin = equationOfTimeMin(now);
  if (snap.today) {
    snap.dayLengthS = static_cast<double>(snap.today->sunset - snap.today->sunrise);
    const auto yesterday = dayLengthS(now - kSecondsPerDay);
    if (yesterday) {
      snap.dayLengthChangeS = *snap.dayLengthS - *yesterday;
    }
  }
  return snap;
}
