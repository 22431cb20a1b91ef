#pragma once

#include <cstdint>
#include <string>

class Frame;

// 3x5 bitmap font, scaled by an integer factor. Lowercase is drawn as
// uppercase; '*' is the degree sign. Unknown characters draw as a box.
namespace pixelfont {

constexpr int kGlyphWidth = 3;
constexpr int kGlyphHeight = 5;
constexpr int kAdvance = kGlyphWidth + 1;

enum class Align : uint8_t { kLeft = 0, kCenter, kRight };

int textWidth(const std::string& text, int scale);
inline int textHeight(int scale) { return kGlyphHeight * scale; }

// (x, y) is the top-left corner for kLeft, the top-centre for kCenter and
// the top-right corner for kRight.
void drawText(Frame& frame, int x, int y, const std::string& text, int scale, uint16_t color,
              Align align = Align::kLeft);

}  // namespace pixelfont
