#pragma once

#include <cstdint>

namespace AppConfig {
constexpr char kConfigPath[] = "/littlefs/config.json";
constexpr float kDefaultLatitude = 37.4220f;
constexpr float kDefaultLongitude = -122.0841f;
// POSIX TZ string, applied with setenv("TZ") + tzset().
constexpr char kDefaultTimezone[] = "PST8PDT,M3.2.0,M11.1.0";

constexpr uint16_t kScreenWidth = 320;
constexpr uint16_t kScreenHeight = 240;
// Raw panel dimensions before software rotation.
constexpr uint16_t kPanelWidth = 240;
constexpr uint16_t kPanelHeight = 320;
constexpr uint8_t kRotation = 1;
constexpr int8_t kTftMisoPin = 12;
constexpr int8_t kTftMosiPin = 13;
constexpr int8_t kTftSclkPin = 14;
constexpr int8_t kTftCsPin = 15;
constexpr int8_t kTftDcPin = 2;
constexpr int8_t kTftRstPin = 12;
constexpr int8_t kBacklightPin = 21;
constexpr bool kBacklightOnHigh = true;
constexpr int8_t kBoardBlueLedPin = 17;
constexpr bool kBoardBlueLedOffHigh = false;
constexpr int8_t kUserButtonPin = 0;
constexpr bool kUserButtonActiveLow = true;
// Holding the BOOT button this long requests an orderly shutdown.
constexpr uint32_t kShutdownHoldMs = 2000;

// CYD XPT2046 calibration for landscape (TFT rotation=1). Ranges are per raw
// controller axis; raw X drives screen Y once swapped.
constexpr uint16_t kTouchRawMinX = 280;
constexpr uint16_t kTouchRawMaxX = 3900;
constexpr uint16_t kTouchRawMinY = 250;
constexpr uint16_t kTouchRawMaxY = 3870;
constexpr bool kTouchSwapXY = true;
constexpr bool kTouchInvertX = false;
constexpr bool kTouchInvertY = true;
constexpr bool kTouchInvertBeforeSwap = false;
constexpr bool kTouchEnabled = true;
constexpr int8_t kTouchCsPin = 33;
constexpr int8_t kTouchIrqPin = 36;
constexpr int8_t kTouchSpiSckPin = 25;
constexpr int8_t kTouchSpiMisoPin = 39;
constexpr int8_t kTouchSpiMosiPin = 32;
constexpr int8_t kSdCsPin = 5;
constexpr uint32_t kTouchPollMs = 15;
// XPT2046 Z1/Z2 pressure below this reads as released.
constexpr int kTouchPressureThreshold = 180;
constexpr uint8_t kTouchSamplesPerAxis = 5;

constexpr int16_t kSwipeThresholdPx = 80;
constexpr int16_t kTapThresholdPx = 30;
constexpr uint32_t kTapTimeoutMs = 400;

constexpr uint16_t kNavBarHeight = 40;
constexpr uint16_t kNavButtonWidth = 50;
constexpr uint16_t kNavButtonHeight = 30;
constexpr uint16_t kNavButtonInset = 10;
constexpr uint16_t kNavHitMargin = 10;

constexpr bool kHttpServerEnabled = true;
constexpr uint16_t kHttpPort = 8080;
constexpr uint16_t kHttpRateLimitPerSecond = 10;
constexpr uint32_t kScreenshotRenderTimeoutMs = 3000;

constexpr uint32_t kWeatherIntervalS = 900;
constexpr uint32_t kAirQualityIntervalS = 1800;
constexpr uint32_t kSolarCacheTtlMs = 60000;
constexpr uint32_t kThemeCacheTtlMs = 60000;
constexpr uint32_t kNetworkTaskPeriodMs = 5000;
constexpr uint32_t kHttpTimeoutMs = 10000;

constexpr uint16_t kWifiConnectTimeoutMs = 12000;

// Boot/loop instrumentation.
constexpr bool kBaselineMetricsEnabled = true;
constexpr uint32_t kBaselineLoopLogPeriodMs = 30000;
}  // namespace AppConfig
