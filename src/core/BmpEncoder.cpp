#include "core/BmpEncoder.h"

#include <cstdint>

namespace {
constexpr uint32_t kFileHeaderBytes = 14;
constexpr uint32_t kInfoHeaderBytes = 40;
constexpr uint32_t kMaskBytes = 12;
constexpr uint32_t kPixelOffset = kFileHeaderBytes + kInfoHeaderBytes + kMaskBytes;
constexpr uint32_t kBiBitfields = 3;

void putU16(std::string& out, uint16_t v) {
  out.push_back(static_cast<char>(v & 0xFFU));
  out.push_back(static_cast<char>((v >> 8) & 0xFFU));
}

void putU32(std::string& out, uint32_t v) {
  putU16(out, static_cast<uint16_t>(v & 0xFFFFU));
  putU16(out, static_cast<uint16_t>(v >> 16));
}

uint32_t rowStride(const Frame& frame) {
  return (static_cast<uint32_t>(frame.width()) * 2U + 3U) & ~3U;
}
}  // namespace

namespace bmp {

size_t encodedSize(const Frame& frame) {
  return kPixelOffset + static_cast<size_t>(rowStride(frame)) * frame.height();
}

void encodeHeader(const Frame& frame, std::string& out) {
  const uint32_t imageBytes = rowStride(frame) * frame.height();
  out += "BM";
  putU32(out, kPixelOffset + imageBytes);
  putU32(out, 0);
  putU32(out, kPixelOffset);

  putU32(out, kInfoHeaderBytes);
  putU32(out, frame.width());
  // Negative height: rows stored top-down.
  putU32(out, static_cast<uint32_t>(-static_cast<int32_t>(frame.height())));
  putU16(out, 1);
  putU16(out, 16);
  putU32(out, kBiBitfields);
  putU32(out, imageBytes);
  putU32(out, 2835);
  putU32(out, 2835);
  putU32(out, 0);
  putU32(out, 0);

  putU32(out, 0xF800);
  putU32(out, 0x07E0);
  putU32(out, 0x001F);
}

void encodeRow(const Frame& frame, uint16_t y, std::string& out) {
  const uint32_t padding = rowStride(frame) - static_cast<uint32_t>(frame.width()) * 2U;
  const uint16_t* line = frame.row(y);
  for (uint16_t x = 0; x < frame.width(); ++x) {
    putU16(out, line[x]);
  }
  out.append(padding, '\0');
}

void encode(const Frame& frame, std::string& out) {
  out.clear();
  out.reserve(encodedSize(frame));
  encodeHeader(frame, out);
  for (uint16_t y = 0; y < frame.height(); ++y) {
    encodeRow(frame, y, out);
  }
}

}  // namespace bmp
