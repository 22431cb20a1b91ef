#pragma once

#include <cstdint>

// ILI9341 on SPI3. Pixels are RGB565 in host byte order; the driver swaps to
// big-endian on the wire.
namespace display_spi {

struct PanelOptions {
  // MADCTL quarter turns; odd values give a 320x240 landscape panel.
  uint8_t rotation = 1;
  bool bgr = false;
  bool invert = true;
};

bool init();
bool initPanel(const PanelOptions& options);
bool clear(uint16_t color565 = 0x0000);
// Full-width band of rows, pushed through the DMA ping-pong buffers.
bool drawRows(uint16_t y, uint16_t rows, const uint16_t* pixels);
// Display off and sleep-in. initPanel() wakes it again.
bool sleep();
uint16_t width();
uint16_t height();

}  // namespace display_spi
