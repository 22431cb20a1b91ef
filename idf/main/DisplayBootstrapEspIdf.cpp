#include "DisplayBootstrapEspIdf.h"

#include "AppConfig.h"

#include "driver/gpio.h"
#include "esp_log.h"
#include "esp_sleep.h"

namespace {
constexpr const char* kTag = "board";

struct PinDefault {
  int8_t pin;
  int level;
  const char* label;
};

bool driveOutput(int8_t pin, int level) {
  if (pin < 0) {
    return true;
  }
  const gpio_num_t gpio = static_cast<gpio_num_t>(pin);
  gpio_config_t cfg = {};
  cfg.pin_bit_mask = 1ULL << gpio;
  cfg.mode = GPIO_MODE_OUTPUT;
  cfg.pull_down_en = GPIO_PULLDOWN_DISABLE;
  cfg.pull_up_en = GPIO_PULLUP_DISABLE;
  cfg.intr_type = GPIO_INTR_DISABLE;
  return gpio_config(&cfg) == ESP_OK && gpio_set_level(gpio, level) == ESP_OK;
}

bool sharesDisplayBus(int8_t pin) {
  return pin >= 0 && (pin == AppConfig::kTftDcPin || pin == AppConfig::kTftCsPin ||
                      pin == AppConfig::kTftSclkPin || pin == AppConfig::kTftMosiPin ||
                      pin == AppConfig::kTftMisoPin);
}

int pressedLevel() { return AppConfig::kUserButtonActiveLow ? 0 : 1; }
}  // namespace

namespace display_bootstrap {

void initPins() {
  // Everything that shares a bus with the panel or touch controller must be
  // deselected before either bus is brought up.
  const PinDefault defaults[] = {
      {AppConfig::kBoardBlueLedPin, AppConfig::kBoardBlueLedOffHigh ? 1 : 0, "board led"},
      {AppConfig::kTouchEnabled ? AppConfig::kTouchCsPin : static_cast<int8_t>(-1), 1,
       "touch cs"},
      {AppConfig::kSdCsPin, 1, "sd cs"},
  };
  for (const PinDefault& d : defaults) {
    if (!driveOutput(d.pin, d.level)) {
      ESP_LOGW(kTag, "%s pin=%d setup failed", d.label, static_cast<int>(d.pin));
    }
  }
  if (sharesDisplayBus(AppConfig::kBoardBlueLedPin)) {
    ESP_LOGW(kTag, "board led pin=%d shares the TFT bus and will flicker",
             static_cast<int>(AppConfig::kBoardBlueLedPin));
  }
  setBacklight(true);
}

void setBacklight(bool on) {
  const int level = (on == AppConfig::kBacklightOnHigh) ? 1 : 0;
  if (!driveOutput(AppConfig::kBacklightPin, level)) {
    ESP_LOGW(kTag, "backlight pin=%d write failed", static_cast<int>(AppConfig::kBacklightPin));
    return;
  }
  ESP_LOGI(kTag, "backlight %s", on ? "on" : "off");
}

void initUserButton() {
  if (AppConfig::kUserButtonPin < 0) {
    return;
  }
  gpio_config_t cfg = {};
  cfg.pin_bit_mask = 1ULL << static_cast<gpio_num_t>(AppConfig::kUserButtonPin);
  cfg.mode = GPIO_MODE_INPUT;
  cfg.pull_up_en = AppConfig::kUserButtonActiveLow ? GPIO_PULLUP_ENABLE : GPIO_PULLUP_DISABLE;
  cfg.pull_down_en = AppConfig::kUserButtonActiveLow ? GPIO_PULLDOWN_DISABLE : GPIO_PULLDOWN_ENABLE;
  cfg.intr_type = GPIO_INTR_DISABLE;
  if (gpio_config(&cfg) != ESP_OK) {
    ESP_LOGW(kTag, "user button config failed pin=%d", static_cast<int>(AppConfig::kUserButtonPin));
  }
}

bool userButtonPressed() {
  if (AppConfig::kUserButtonPin < 0) {
    return false;
  }
  return gpio_get_level(static_cast<gpio_num_t>(AppConfig::kUserButtonPin)) == pressedLevel();
}

bool armWakeOnUserButton() {
  if (AppConfig::kUserButtonPin < 0) {
    return false;
  }
  const esp_err_t err = esp_sleep_enable_ext0_wakeup(
      static_cast<gpio_num_t>(AppConfig::kUserButtonPin), pressedLevel());
  if (err != ESP_OK) {
    ESP_LOGW(kTag, "ext0 wake setup failed err=0x%x", static_cast<unsigned>(err));
    return false;
  }
  return true;
}

bool ButtonHold::update(bool pressed, uint32_t nowMs) {
  if (!pressed) {
    armed_ = true;
    pressed_ = false;
    return false;
  }
  if (!armed_) {
    return false;
  }
  if (!pressed_) {
    pressed_ = true;
    pressedSinceMs_ = nowMs;
    return false;
  }
  return nowMs - pressedSinceMs_ >= holdMs_;
}

}  // namespace display_bootstrap
