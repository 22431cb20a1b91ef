#pragma once

#include <ctime>

struct MoonInfo {
  // Lunation 0..1: 0 new, 0.5 full.
  double phase = 0.0;
  double illuminationPct = 0.0;
  const char* phaseName = "";
  double ageDays = 0.0;
  double daysToNew = 0.0;
  double daysToFull = 0.0;
};

namespace lunar {

constexpr double kSynodicMonthDays = 29.530588853;

MoonInfo moonInfo(time_t nowUtc);
const char* phaseName(double phase);

}  // namespace lunar
