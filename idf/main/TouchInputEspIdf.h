#pragma once

#include <cstdint>

// XPT2046 resistive controller on its own SPI bus. Reports raw, unmapped
// coordinates; screen mapping lives in TouchMapper.
namespace touch_input {

struct Options {
  uint16_t pressureThreshold = 180;
  // Conversions per axis per read; the median is reported.
  uint8_t samplesPerAxis = 5;
};

struct RawSample {
  uint16_t rawX = 0;
  uint16_t rawY = 0;
  uint16_t z = 0;
};

enum class ReadResult : uint8_t { kReleased = 0, kPressed, kBusError };

bool init(const Options& options);
ReadResult read(RawSample& out);
// Removes the SPI device and frees the bus. init() may be called again.
void release();

}  // namespace touch_input
