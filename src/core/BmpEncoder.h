#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "core/Frame.h"

namespace bmp {

// 16-bit BI_BITFIELDS bitmap with RGB565 masks, so the frame is stored
// without any color conversion.
size_t encodedSize(const Frame& frame);
void encode(const Frame& frame, std::string& out);

// Streaming form of encode(): the header, then each row top to bottom.
// Both append to `out`.
void encodeHeader(const Frame& frame, std::string& out);
void encodeRow(const Frame& frame, uint16_t y, std::string& out);

}  // namespace bmp
