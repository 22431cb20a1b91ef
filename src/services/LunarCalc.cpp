#include "services/LunarCalc.h"

#include <cmath>

namespace {
// New moon of 2000-01-06 18:14 UTC.
constexpr double kReferenceNewMoonUnix = 947182440.0;
constexpr double kSecondsPerDay = 86400.0;
constexpr double kPi = 3.14159265358979323846;
}  // namespace

namespace lunar {

const char* phaseName(double phase) {
  if (phase < 0.03) {
    return "New Moon";
  }
  if (phase < 0.22) {
    return "Waxing Crescent";
  }
  if (phase < 0.28) {
    return "First Quarter";
  }
  if (phase < 0.47) {
    return "Waxing Gibbous";
  }
  if (phase < 0.53) {
    return "Full Moon";
  }
  if (phase < 0.72) {
    return "Waning Gibbous";
  }
  if (phase < 0.78) {
    return "Last Quarter";
  }
  if (phase < 0.97) {
    return "Waning Crescent";
  }
  return "New Moon";
}

MoonInfo moonInfo(time_t nowUtc) {
  const double days = (static_cast<double>(nowUtc) - kReferenceNewMoonUnix) / kSecondsPerDay;
  double age = std::fmod(days, kSynodicMonthDays);
  if (age < 0.0) {
    age += kSynodicMonthDays;
  }

  MoonInfo info;
  info.ageDays = age;
  info.phase = age / kSynodicMonthDays;
  info.illuminationPct = (1.0 - std::cos(2.0 * kPi * info.phase)) / 2.0 * 100.0;
  info.phaseName = phaseName(info.phase);
  info.daysToNew = kSynodicMonthDays - age;
  const double half = kSynodicMonthDays / 2.0;
  info.daysToFull = age < half ? half - age : kSynodicMonthDays - age + half;
  return info;
}

}  // namespace lunar
