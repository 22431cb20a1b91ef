#pragma once

#include <cstdint>

struct TouchCalibration {
  uint16_t rawMinX = 0;
  uint16_t rawMaxX = 4095;
  uint16_t rawMinY = 0;
  uint16_t rawMaxY = 4095;
  // Panel mounted rotated 90 degrees: raw X drives screen Y and vice versa.
  bool swapXY = false;
  bool invertX = false;
  bool invertY = false;
  // When set, invertX/invertY address the raw controller axes (applied
  // before the swap) instead of the screen axes.
  bool invertBeforeSwap = false;
};

struct TouchPoint {
  uint16_t x = 0;
  uint16_t y = 0;
};

// Raw controller sample -> screen pixel. Stateless.
class TouchMapper {
 public:
  TouchMapper(uint16_t screenWidth, uint16_t screenHeight, const TouchCalibration& calibration);

  TouchPoint map(uint16_t rawX, uint16_t rawY) const;

  uint16_t screenWidth() const { return width_; }
  uint16_t screenHeight() const { return height_; }
  const TouchCalibration& calibration() const { return calibration_; }

 private:
  uint16_t width_;
  uint16_t height_;
  TouchCalibration calibration_;
};
