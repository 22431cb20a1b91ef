#include "DisplaySinkEspIdf.h"

#include "DisplaySpiEspIdf.h"
#include "esp_log.h"

namespace {
constexpr const char* kTag = "tft";

uint32_t hashRow(const uint16_t* px, uint16_t width) {
  uint32_t h = 2166136261U;
  for (uint16_t i = 0; i < width; ++i) {
    h = (h ^ px[i]) * 16777619U;
  }
  return h;
}
}  // namespace

bool SpiDisplaySink::write(const Frame& frame) {
  if (frame.width() != display_spi::width() || frame.height() != display_spi::height()) {
    ESP_LOGW(kTag, "frame %ux%u != panel %ux%u", frame.width(), frame.height(),
             display_spi::width(), display_spi::height());
    return false;
  }

  const uint16_t height = frame.height();
  const bool full = rowHashes_.size() != height;
  std::vector<uint32_t> hashes(height);
  int first = -1;
  int last = -1;
  for (uint16_t y = 0; y < height; ++y) {
    hashes[y] = hashRow(frame.row(y), frame.width());
    if (full || hashes[y] != rowHashes_[y]) {
      if (first < 0) {
        first = y;
      }
      last = y;
    }
  }
  if (first < 0) {
    return true;
  }

  const uint16_t y0 = static_cast<uint16_t>(first);
  const uint16_t rows = static_cast<uint16_t>(last - first + 1);
  if (!display_spi::drawRows(y0, rows, frame.row(y0))) {
    rowHashes_.clear();
    return false;
  }
  rowHashes_.swap(hashes);
  return true;
}

void SpiDisplaySink::invalidate() { rowHashes_.clear(); }
