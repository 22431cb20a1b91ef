#include "RuntimeSettings.h"

#include "platform/Platform.h"
#include "platform/Prefs.h"

namespace {
constexpr const char* kTag = "settings";
constexpr char kPrefsNs[] = "settings";
constexpr char kClock24Key[] = "clock24";
constexpr char kThemeKey[] = "theme";
constexpr char kLastPanelKey[] = "last_panel";
}  // namespace

namespace RuntimeSettings {
bool use24HourClock = false;
int8_t themeMode = -1;
int32_t lastPanel = -1;

void load() {
  use24HourClock = platform::prefs::getBool(kPrefsNs, kClock24Key, use24HourClock);
  const int32_t theme = platform::prefs::getInt(kPrefsNs, kThemeKey, themeMode);
  themeMode = (theme >= -1 && theme <= 2) ? static_cast<int8_t>(theme) : -1;
  lastPanel = platform::prefs::getInt(kPrefsNs, kLastPanelKey, lastPanel);
}

void save() {
  const bool ok = platform::prefs::putBool(kPrefsNs, kClock24Key, use24HourClock) &&
                  platform::prefs::putInt(kPrefsNs, kThemeKey, themeMode) &&
                  platform::prefs::putInt(kPrefsNs, kLastPanelKey, lastPanel);
  if (!ok) {
    platform::logw(kTag, "save failed");
  }
}
}  // namespace RuntimeSettings
