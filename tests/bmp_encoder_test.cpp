#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "core/BmpEncoder.h"

namespace {

uint32_t u32At(const std::string& s, size_t off) {
  return static_cast<uint32_t>(static_cast<uint8_t>(s[off])) |
         (static_cast<uint32_t>(static_cast<uint8_t>(s[off + 1])) << 8) |
         (static_cast<uint32_t>(static_cast<uint8_t>(s[off + 2])) << 16) |
         (static_cast<uint32_t>(static_cast<uint8_t>(s[off + 3])) << 24);
}

uint16_t u16At(const std::string& s, size_t off) {
  return static_cast<uint16_t>(static_cast<uint8_t>(s[off]) |
                               (static_cast<uint8_t>(s[off + 1]) << 8));
}

constexpr size_t kPixelOffset = 66;

}  // namespace

TEST(BmpEncoderTest, HeaderDescribesTopDownRgb565) {
  Frame frame(3, 2);
  std::string out;
  bmp::encode(frame, out);

  // 3 px * 2 bytes padded to 8 bytes per row.
  ASSERT_EQ(out.size(), kPixelOffset + 8 * 2);
  EXPECT_EQ(bmp::encodedSize(frame), out.size());
  EXPECT_EQ(out.substr(0, 2), "BM");
  EXPECT_EQ(u32At(out, 2), out.size());
  EXPECT_EQ(u32At(out, 10), kPixelOffset);
  EXPECT_EQ(u32At(out, 14), 40u);
  EXPECT_EQ(u32At(out, 18), 3u);
  EXPECT_EQ(static_cast<int32_t>(u32At(out, 22)), -2);
  EXPECT_EQ(u16At(out, 26), 1);
  EXPECT_EQ(u16At(out, 28), 16);
  EXPECT_EQ(u32At(out, 30), 3u);
  EXPECT_EQ(u32At(out, 54), 0xF800u);
  EXPECT_EQ(u32At(out, 58), 0x07E0u);
  EXPECT_EQ(u32At(out, 62), 0x001Fu);
}

TEST(BmpEncoderTest, PixelsAreStoredVerbatimWithRowPadding) {
  Frame frame(3, 2);
  frame.setPixel(0, 0, 0x1234);
  frame.setPixel(2, 0, 0xABCD);
  frame.setPixel(1, 1, rgb565(255, 0, 0));
  std::string out;
  bmp::encode(frame, out);

  EXPECT_EQ(u16At(out, kPixelOffset + 0), 0x1234);
  EXPECT_EQ(u16At(out, kPixelOffset + 4), 0xABCD);
  EXPECT_EQ(u16At(out, kPixelOffset + 6), 0);
  EXPECT_EQ(u16At(out, kPixelOffset + 8 + 2), 0xF800);
}

TEST(BmpEncoderTest, StreamingMatchesOneShot) {
  Frame frame(5, 3);
  frame.fillRect(1, 1, 3, 2, rgb565(0, 255, 0));
  std::string whole;
  bmp::encode(frame, whole);

  std::string streamed;
  bmp::encodeHeader(frame, streamed);
  EXPECT_EQ(streamed.size(), kPixelOffset);
  for (uint16_t y = 0; y < frame.height(); ++y) {
    bmp::encodeRow(frame, y, streamed);
  }
  EXPECT_EQ(streamed, whole);
}
