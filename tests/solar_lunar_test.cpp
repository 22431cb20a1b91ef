#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <vector>

#include "core/TimeSync.h"
#include "services/LunarCalc.h"
#include "services/SolarCalc.h"

namespace {

constexpr time_t kEquinoxMidnightUtc = 1710892800;  // 2024-03-20 00:00
constexpr time_t kEquinoxNoonUtc = 1710936000;
constexpr time_t kJuneNoonUtc = 1718971200;
constexpr time_t kNewMoonUtc = 1704974220;   // 2024-01-11 11:57
constexpr time_t kFullMoonUtc = 1706205240;  // 2024-01-25 17:54

double hoursAfterMidnight(time_t t) {
  return static_cast<double>(t - kEquinoxMidnightUtc) / 3600.0;
}

class SolarCalcTest : public ::testing::Test {
 protected:
  void SetUp() override { timesync::applyTimezone("UTC0"); }
};

}  // namespace

TEST_F(SolarCalcTest, EquatorEquinoxHasTwelveHourDay) {
  SolarCalc solar(0.0, 0.0);
  const auto times = solar.sunTimes(kEquinoxNoonUtc);
  ASSERT_TRUE(times.has_value());
  EXPECT_NEAR(hoursAfterMidnight(times->sunrise), 6.07, 0.1);
  EXPECT_NEAR(hoursAfterMidnight(times->sunset), 18.18, 0.1);
  EXPECT_NEAR(hoursAfterMidnight(times->noon), 12.12, 0.1);
  EXPECT_LT(times->dawn, times->sunrise);
  EXPECT_GT(times->dusk, times->sunset);

  const auto length = solar.dayLengthS(kEquinoxNoonUtc);
  ASSERT_TRUE(length.has_value());
  EXPECT_NEAR(*length / 3600.0, 12.11, 0.1);
}

TEST_F(SolarCalcTest, SunIsNearlyOverheadAtEquatorNoon) {
  SolarCalc solar(0.0, 0.0);
  const SolarPosition pos = solar.position(kEquinoxNoonUtc);
  EXPECT_GT(pos.elevationDeg, 85.0);
  EXPECT_GE(pos.azimuthDeg, 0.0);
  EXPECT_LT(pos.azimuthDeg, 360.0);
}

TEST_F(SolarCalcTest, PolarDayHasNoSunTimes) {
  SolarCalc arctic(80.0, 0.0);
  EXPECT_FALSE(arctic.sunTimes(kJuneNoonUtc).has_value());
  EXPECT_FALSE(arctic.dayLengthS(kJuneNoonUtc).has_value());
  EXPECT_GT(arctic.position(kJuneNoonUtc).elevationDeg, 0.0);

  const SolarSnapshot snap = arctic.snapshot(kJuneNoonUtc);
  EXPECT_FALSE(snap.today.has_value());
  EXPECT_FALSE(snap.dayLengthS.has_value());
  EXPECT_EQ(snap.computedAt, kJuneNoonUtc);
}

TEST_F(SolarCalcTest, NextEventWalksThroughTheDay) {
  SolarCalc solar(0.0, 0.0);
  const auto early = solar.nextEvent(kEquinoxMidnightUtc + 3600);
  ASSERT_TRUE(early.has_value());
  EXPECT_STREQ(early->name, "Dawn");

  const auto afternoon = solar.nextEvent(kEquinoxNoonUtc);
  ASSERT_TRUE(afternoon.has_value());
  EXPECT_STREQ(afternoon->name, "Sunset");
  EXPECT_GT(afternoon->at, kEquinoxNoonUtc);

  // After dusk the next event is tomorrow's dawn.
  const auto late = solar.nextEvent(kEquinoxMidnightUtc + 23 * 3600);
  ASSERT_TRUE(late.has_value());
  EXPECT_STREQ(late->name, "Dawn");
  EXPECT_GT(late->at, kEquinoxMidnightUtc + 24 * 3600);
}

TEST_F(SolarCalcTest, SnapshotCarriesDayLengthChange) {
  // Days lengthen after the March equinox in the north.
  SolarCalc solar(45.0, 0.0);
  const SolarSnapshot snap = solar.snapshot(kEquinoxNoonUtc);
  ASSERT_TRUE(snap.dayLengthS.has_value());
  ASSERT_TRUE(snap.dayLengthChangeS.has_value());
  EXPECT_GT(*snap.dayLengthChangeS, 0.0);
  EXPECT_LT(*snap.dayLengthChangeS, 300.0);
}

TEST_F(SolarCalcTest, GoldenHoursHugSunriseAndSunset) {
  SolarCalc solar(45.0, 0.0);
  const auto times = solar.sunTimes(kEquinoxNoonUtc);
  const auto golden = solar.goldenHours(kEquinoxNoonUtc);
  ASSERT_TRUE(times.has_value());
  ASSERT_TRUE(golden.has_value());
  EXPECT_EQ(golden->morningStart, times->sunrise);
  EXPECT_EQ(golden->morningEnd - golden->morningStart, 45 * 60);
  EXPECT_EQ(golden->eveningEnd, times->sunset);
  EXPECT_EQ(golden->eveningEnd - golden->eveningStart, 45 * 60);

  SolarCalc arctic(80.0, 0.0);
  EXPECT_FALSE(arctic.goldenHours(kJuneNoonUtc).has_value());
}

TEST_F(SolarCalcTest, EquationOfTimeFollowsTheSeasons) {
  // 2024-02-11: sun about 14 minutes behind the clock.
  const double february = SolarCalc::equationOfTimeMin(1707609600);
  EXPECT_GT(february, -15.5);
  EXPECT_LT(february, -13.0);
  // 2024-11-03: sun about 16 minutes ahead.
  const double november = SolarCalc::equationOfTimeMin(1730592000);
  EXPECT_GT(november, 15.0);
  EXPECT_LT(november, 17.5);
}

TEST_F(SolarCalcTest, AnalemmaSamplesTheYearWeekly) {
  SolarCalc solar(40.0, 0.0);
  const std::vector<AnalemmaPoint> points = solar.analemma(2024);
  ASSERT_EQ(points.size(), 53u);
  EXPECT_EQ(points.front().dayOfYear, 0);
  EXPECT_EQ(points.front().month, 1);
  EXPECT_EQ(points.back().dayOfYear, 364);
  EXPECT_EQ(points.back().month, 12);

  double highest = -90.0;
  double lowest = 90.0;
  for (const AnalemmaPoint& point : points) {
    highest = std::max(highest, point.noonElevationDeg);
    lowest = std::min(lowest, point.noonElevationDeg);
  }
  // 90 - 40 +/- 23.44 degrees at the solstices.
  EXPECT_NEAR(highest, 73.4, 1.0);
  EXPECT_NEAR(lowest, 26.6, 1.0);
}

TEST(LunarTest, KnownNewMoon) {
  const MoonInfo info = lunar::moonInfo(kNewMoonUtc);
  EXPECT_TRUE(info.phase < 0.03 || info.phase > 0.97);
  EXPECT_LT(info.illuminationPct, 2.0);
  EXPECT_STREQ(info.phaseName, "New Moon");
}

TEST(LunarTest, KnownFullMoon) {
  const MoonInfo info = lunar::moonInfo(kFullMoonUtc);
  EXPECT_NEAR(info.phase, 0.5, 0.03);
  EXPECT_GT(info.illuminationPct, 98.0);
  EXPECT_STREQ(info.phaseName, "Full Moon");
  EXPECT_NEAR(info.ageDays + info.daysToNew, lunar::kSynodicMonthDays, 1e-9);
}

TEST(LunarTest, PhaseNamesCoverTheCycle) {
  EXPECT_STREQ(lunar::phaseName(0.0), "New Moon");
  EXPECT_STREQ(lunar::phaseName(0.1), "Waxing Crescent");
  EXPECT_STREQ(lunar::phaseName(0.25), "First Quarter");
  EXPECT_STREQ(lunar::phaseName(0.4), "Waxing Gibbous");
  EXPECT_STREQ(lunar::phaseName(0.6), "Waning Gibbous");
  EXPECT_STREQ(lunar::phaseName(0.75), "Last Quarter");
  EXPECT_STREQ(lunar::phaseName(0.9), "Waning Crescent");
  EXPECT_STREQ(lunar::phaseName(0.99), "New Moon");
}

TEST(LunarTest, DaysToFullIsWithinOneCycle) {
  const MoonInfo info = lunar::moonInfo(kNewMoonUtc + 3 * 86400);
  EXPECT_GT(info.daysToFull, 0.0);
  EXPECT_LT(info.daysToFull, lunar::kSynodicMonthDays / 2.0);
}
