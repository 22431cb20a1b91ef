#include "core/Frame.h"

#include <algorithm>
#include <cstdlib>

Frame::Frame(uint16_t width, uint16_t height)
    : width_(width), height_(height), pixels_(static_cast<size_t>(width) * height, 0) {}

void Frame::fill(uint16_t color) { std::fill(pixels_.begin(), pixels_.end(), color); }

void Frame::setPixel(int x, int y, uint16_t color) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) {
    return;
  }
  pixels_[static_cast<size_t>(y) * width_ + static_cast<size_t>(x)] = color;
}

uint16_t Frame::pixel(int x, int y) const {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) {
    return 0;
  }
  return pixels_[static_cast<size_t>(y) * width_ + static_cast<size_t>(x)];
}

void Frame::fillRect(int x, int y, int w, int h, uint16_t color) {
  const int x0 = std::max(x, 0);
  const int y0 = std::max(y, 0);
  const int x1 = std::min(x + w, static_cast<int>(width_));
  const int y1 = std::min(y + h, static_cast<int>(height_));
  for (int yy = y0; yy < y1; ++yy) {
    uint16_t* line = pixels_.data() + static_cast<size_t>(yy) * width_;
    std::fill(line + x0, line + std::max(x0, x1), color);
  }
}

void Frame::drawRect(int x, int y, int w, int h, uint16_t color) {
  if (w <= 0 || h <= 0) {
    return;
  }
  fillRect(x, y, w, 1, color);
  fillRect(x, y + h - 1, w, 1, color);
  fillRect(x, y, 1, h, color);
  fillRect(x + w - 1, y, 1, h, color);
}

void Frame::drawLine(int x0, int y0, int x1, int y1, uint16_t color) {
  // Bresenham.
  const int dx = std::abs(x1 - x0);
  const int sx = x0 < x1 ? 1 : -1;
  const int dy = -std::abs(y1 - y0);
  const int sy = y0 < y1 ? 1 : -1;
  int err = dx + dy;
  for (;;) {
    setPixel(x0, y0, color);
    if (x0 == x1 && y0 == y1) {
      break;
    }
    const int e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x0 += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y0 += sy;
    }
  }
}

void Frame::drawThickLine(int x0, int y0, int x1, int y1, int thickness, uint16_t color) {
  if (thickness <= 1) {
    drawLine(x0, y0, x1, y1, color);
    return;
  }
  const int r = thickness / 2;
  const int dx = std::abs(x1 - x0);
  const int sx = x0 < x1 ? 1 : -1;
  const int dy = -std::abs(y1 - y0);
  const int sy = y0 < y1 ? 1 : -1;
  int err = dx + dy;
  for (;;) {
    fillRect(x0 - r, y0 - r, thickness, thickness, color);
    if (x0 == x1 && y0 == y1) {
      break;
    }
    const int e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x0 += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y0 += sy;
    }
  }
}

void Frame::drawCircle(int cx, int cy, int r, uint16_t color) {
  int x = r;
  int y = 0;
  int err = 1 - r;
  while (x >= y) {
    setPixel(cx + x, cy + y, color);
    setPixel(cx + y, cy + x, color);
    setPixel(cx - y, cy + x, color);
    setPixel(cx - x, cy + y, color);
    setPixel(cx - x, cy - y, color);
    setPixel(cx - y, cy - x, color);
    setPixel(cx + y, cy - x, color);
    setPixel(cx + x, cy - y, color);
    ++y;
    if (err < 0) {
      err += 2 * y + 1;
    } else {
      --x;
      err += 2 * (y - x) + 1;
    }
  }
}

void Frame::fillCircle(int cx, int cy, int r, uint16_t color) {
  for (int dy = -r; dy <= r; ++dy) {
    int half = 0;
    while ((half + 1) * (half + 1) + dy * dy <= r * r) {
      ++half;
    }
    fillRect(cx - half, cy + dy, 2 * half + 1, 1, color);
  }
}
