#pragma once

#include <cstdint>

namespace RuntimeSettings {
extern bool use24HourClock;
// Theme chosen at runtime: 0 auto, 1 day, 2 night, -1 when never saved
// (the config file value applies).
extern int8_t themeMode;
// Panel index shown at shutdown; -1 when none was saved.
extern int32_t lastPanel;

void load();
void save();
}  // namespace RuntimeSettings
