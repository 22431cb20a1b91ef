#include <gtest/gtest.h>

#include "core/ThemeState.h"
#include "core/TimeSync.h"
#include "services/SolarCalc.h"

namespace {

// 2024-03-20, equinox.
constexpr time_t kEquinoxNoonUtc = 1710936000;
constexpr time_t kEquinox0300Utc = 1710903600;
// Midsummer / midwinter noon.
constexpr time_t kJuneMidnightUtc = 1718928000;
constexpr time_t kDecemberNoonUtc = 1734782400;

class ThemeStateTest : public ::testing::Test {
 protected:
  void SetUp() override { timesync::applyTimezone("UTC0"); }

  time_t wall_ = kEquinoxNoonUtc;
  uint32_t mono_ = 0;
};

}  // namespace

TEST(ThemeModeTest, ParsesCaseInsensitively) {
  ThemeMode mode = ThemeMode::kAuto;
  ASSERT_TRUE(parseThemeMode("Night", mode));
  EXPECT_EQ(mode, ThemeMode::kNight);
  ASSERT_TRUE(parseThemeMode("DAY", mode));
  EXPECT_EQ(mode, ThemeMode::kDay);
  EXPECT_FALSE(parseThemeMode("dusk", mode));
  EXPECT_EQ(mode, ThemeMode::kDay);
  EXPECT_STREQ(themeModeName(ThemeMode::kAuto), "auto");
}

TEST_F(ThemeStateTest, AutoFollowsSunriseAndSunset) {
  SolarCalc solar(0.0, 0.0);
  ThemeState theme(&solar, ThemeMode::kAuto, 0, [this] { return wall_; }, [this] { return mono_; });
  EXPECT_TRUE(theme.isDaytime());
  EXPECT_STREQ(theme.activeTheme(), "day");
  wall_ = kEquinox0300Utc;
  EXPECT_FALSE(theme.isDaytime());
  EXPECT_STREQ(theme.activeTheme(), "night");
}

TEST_F(ThemeStateTest, ForcedModesIgnoreTheSun) {
  SolarCalc solar(0.0, 0.0);
  ThemeState theme(&solar, ThemeMode::kNight, 0, [this] { return wall_; },
                   [this] { return mono_; });
  EXPECT_STREQ(theme.activeTheme(), "night");
  theme.setMode(ThemeMode::kDay);
  wall_ = kEquinox0300Utc;
  EXPECT_STREQ(theme.activeTheme(), "day");
  EXPECT_EQ(theme.mode(), ThemeMode::kDay);
}

TEST_F(ThemeStateTest, DaytimeIsCachedForTtl) {
  SolarCalc solar(0.0, 0.0);
  ThemeState theme(&solar, ThemeMode::kAuto, 60000, [this] { return wall_; },
                   [this] { return mono_; });
  EXPECT_TRUE(theme.isDaytime());
  wall_ = kEquinox0300Utc;
  mono_ = 59999;
  EXPECT_TRUE(theme.isDaytime());
  mono_ = 60000;
  EXPECT_FALSE(theme.isDaytime());
}

TEST_F(ThemeStateTest, PolarDayAndNightUseSolarElevation) {
  SolarCalc arctic(80.0, 0.0);
  ThemeState theme(&arctic, ThemeMode::kAuto, 0, [this] { return wall_; },
                   [this] { return mono_; });
  wall_ = kJuneMidnightUtc;
  EXPECT_TRUE(theme.isDaytime());
  wall_ = kDecemberNoonUtc;
  EXPECT_FALSE(theme.isDaytime());
}

TEST_F(ThemeStateTest, WithoutLocationFallsBackToClockHours) {
  ThemeState theme(nullptr, ThemeMode::kAuto, 0, [this] { return wall_; },
                   [this] { return mono_; });
  EXPECT_TRUE(theme.isDaytime());
  wall_ = kEquinox0300Utc;
  EXPECT_FALSE(theme.isDaytime());
}

TEST_F(ThemeStateTest, StatusJsonReportsModeAndActiveTheme) {
  ThemeState theme(nullptr, ThemeMode::kDay, 0, [this] { return wall_; },
                   [this] { return mono_; });
  wall_ = kEquinox0300Utc;
  EXPECT_EQ(theme.statusJson(), "{\"mode\":\"day\",\"active_theme\":\"day\",\"is_daytime\":false}");
}
