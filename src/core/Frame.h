#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

inline uint16_t rgb565(uint8_t r, uint8_t g, uint8_t b) {
  return static_cast<uint16_t>(((r & 0xF8U) << 8) | ((g & 0xFCU) << 3) | (b >> 3));
}

// Full-screen RGB565 buffer in the panel's native format. Drawing calls clip
// to the frame bounds.
class Frame {
 public:
  Frame(uint16_t width, uint16_t height);

  uint16_t width() const { return width_; }
  uint16_t height() const { return height_; }
  const uint16_t* data() const { return pixels_.data(); }
  const uint16_t* row(uint16_t y) const { return pixels_.data() + static_cast<size_t>(y) * width_; }

  void fill(uint16_t color);
  void setPixel(int x, int y, uint16_t color);
  uint16_t pixel(int x, int y) const;
  void fillRect(int x, int y, int w, int h, uint16_t color);
  void drawRect(int x, int y, int w, int h, uint16_t color);
  void drawLine(int x0, int y0, int x1, int y1, uint16_t color);
  void drawThickLine(int x0, int y0, int x1, int y1, int thickness, uint16_t color);
  void drawCircle(int cx, int cy, int r, uint16_t color);
  void fillCircle(int cx, int cy, int r, uint16_t color);

 private:
  uint16_t width_;
  uint16_t height_;
  std::vector<uint16_t> pixels_;
};
