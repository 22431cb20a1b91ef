// Frame.h comes first so the header has to stand on its own includes.
#include "core/Frame.h"

#include <gtest/gtest.h>

TEST(FrameTest, RowsAddressThePixelBuffer) {
  Frame frame(8, 4);
  frame.setPixel(3, 2, 0x1234);
  const uint16_t* row = frame.row(2);
  EXPECT_EQ(row, frame.data() + 2 * 8);
  EXPECT_EQ(row[3], 0x1234);
  EXPECT_EQ(frame.row(0)[3], 0);
}

TEST(FrameTest, DrawingClipsToBounds) {
  Frame frame(8, 4);
  frame.fillRect(-4, -4, 6, 6, 0xFFFF);
  EXPECT_EQ(frame.pixel(0, 0), 0xFFFF);
  EXPECT_EQ(frame.pixel(1, 1), 0xFFFF);
  EXPECT_EQ(frame.pixel(2, 2), 0);
  frame.setPixel(8, 0, 0x00FF);
  frame.setPixel(-1, 3, 0x00FF);
  EXPECT_EQ(frame.pixel(8, 0), 0);
  EXPECT_EQ(frame.pixel(7, 3), 0);
  frame.drawLine(-10, 3, 20, 3, 0x0F0F);
  EXPECT_EQ(frame.pixel(0, 3), 0x0F0F);
  EXPECT_EQ(frame.pixel(7, 3), 0x0F0F);
}
