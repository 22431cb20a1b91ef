#include "core/TouchMapper.h"

#include <algorithm>
#include <utility>

namespace {

double normalize(uint16_t raw, uint16_t rawMin, uint16_t rawMax) {
  if (rawMax <= rawMin) {
    return 0.0;
  }
  const uint16_t clamped = std::min(std::max(raw, rawMin), rawMax);
  return static_cast<double>(clamped - rawMin) / static_cast<double>(rawMax - rawMin);
}

uint16_t scaleToPixels(double normalized, uint16_t size) {
  if (size == 0) {
    return 0;
  }
  int32_t px = static_cast<int32_t>(normalized * static_cast<double>(size));
  px = std::min<int32_t>(std::max<int32_t>(px, 0), static_cast<int32_t>(size) - 1);
  return static_cast<uint16_t>(px);
}

}  // namespace

TouchMapper::TouchMapper(uint16_t screenWidth, uint16_t screenHeight,
                         const TouchCalibration& calibration)
    : width_(screenWidth), height_(screenHeight), calibration_(calibration) {}

TouchPoint TouchMapper::map(uint16_t rawX, uint16_t rawY) const {
  double nx = normalize(rawX, calibration_.rawMinX, calibration_.rawMaxX);
  double ny = normalize(rawY, calibration_.rawMinY, calibration_.rawMaxY);

  if (calibration_.invertBeforeSwap) {
    if (calibration_.invertX) {
      nx = 1.0 - nx;
    }
    if (calibration_.invertY) {
      ny = 1.0 - ny;
    }
  }
  if (calibration_.swapXY) {
    std::swap(nx, ny);
  }
  if (!calibration_.invertBeforeSwap) {
    if (calibration_.invertX) {
      nx = 1.0 - nx;
    }
    if (calibration_.invertY) {
      ny = 1.0 - ny;
    }
  }

  TouchPoint out;
  out.x = scaleToPixels(nx, width_);
  out.y = scaleToPixels(ny, height_);
  return out;
}
