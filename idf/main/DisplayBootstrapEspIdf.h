#pragma once

#include <cstdint>

namespace display_bootstrap {

// Board LED off, shared-bus chip selects high, backlight on.
void initPins();
void setBacklight(bool on);

// BOOT button, used to request shutdown and to wake from deep sleep.
void initUserButton();
bool userButtonPressed();
// ext0 wake on the BOOT button level that means "pressed".
bool armWakeOnUserButton();

// Reports a hold once it has lasted holdMs. Starts disarmed so the press that
// woke the board has to be released before it can count.
class ButtonHold {
 public:
  explicit ButtonHold(uint32_t holdMs) : holdMs_(holdMs) {}

  bool update(bool pressed, uint32_t nowMs);

 private:
  uint32_t holdMs_;
  uint32_t pressedSinceMs_ = 0;
  bool armed_ = false;
  bool pressed_ = false;
};

}  // namespace display_bootstrap
