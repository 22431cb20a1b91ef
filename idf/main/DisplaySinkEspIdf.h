#pragma once

#include <cstdint>
#include <vector>

#include "core/RenderScheduler.h"

// Pushes frames to the ILI9341 through display_spi. Only the band between the
// first and last changed row is sent; rows are compared by hash.
class SpiDisplaySink : public DisplaySink {
 public:
  bool write(const Frame& frame) override;
  // Forces the next write to send every row (after clear or wake).
  void invalidate();

 private:
  std::vector<uint32_t> rowHashes_;
};
