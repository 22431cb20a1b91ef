#include "panels/PixelFont.h"

#include <cctype>

#include "core/Frame.h"

namespace {

struct Glyph {
  char ch;
  uint8_t rows[pixelfont::kGlyphHeight];  // bit 2 = left column
};

constexpr Glyph kGlyphs[] = {
    {'0', {7, 5, 5, 5, 7}}, {'1', {2, 6, 2, 2, 7}}, {'2', {7, 1, 7, 4, 7}},
    {'3', {7, 1, 3, 1, 7}}, {'4', {5, 5, 7, 1, 1}}, {'5', {7, 4, 7, 1, 7}},
    {'6', {7, 4, 7, 5, 7}}, {'7', {7, 1, 1, 2, 2}}, {'8', {7, 5, 7, 5, 7}},
    {'9', {7, 5, 7, 1, 7}}, {'A', {2, 5, 7, 5, 5}}, {'B', {6, 5, 6, 5, 6}},
    {'C', {3, 4, 4, 4, 3}}, {'D', {6, 5, 5, 5, 6}}, {'E', {7, 4, 6, 4, 7}},
    {'F', {7, 4, 6, 4, 4}}, {'G', {3, 4, 5, 5, 3}}, {'H', {5, 5, 7, 5, 5}},
    {'I', {7, 2, 2, 2, 7}}, {'J', {1, 1, 1, 5, 2}}, {'K', {5, 5, 6, 5, 5}},
    {'L', {4, 4, 4, 4, 7}}, {'M', {5, 7, 7, 5, 5}}, {'N', {6, 5, 5, 5, 5}},
    {'O', {2, 5, 5, 5, 2}}, {'P', {6, 5, 6, 4, 4}}, {'Q', {2, 5, 5, 6, 3}},
    {'R', {6, 5, 6, 5, 5}}, {'S', {3, 4, 2, 1, 6}}, {'T', {7, 2, 2, 2, 2}},
    {'U', {5, 5, 5, 5, 7}}, {'V', {5, 5, 5, 5, 2}}, {'W', {5, 5, 7, 7, 5}},
    {'X', {5, 5, 2, 5, 5}}, {'Y', {5, 5, 2, 2, 2}}, {'Z', {7, 1, 2, 4, 7}},
    {' ', {0, 0, 0, 0, 0}}, {'.', {0, 0, 0, 0, 2}}, {',', {0, 0, 0, 2, 4}},
    {':', {0, 2, 0, 2, 0}}, {'-', {0, 0, 7, 0, 0}}, {'+', {0, 2, 7, 2, 0}},
    {'/', {1, 1, 2, 4, 4}}, {'%', {5, 1, 2, 4, 5}}, {'(', {1, 2, 2, 2, 1}},
    {')', {4, 2, 2, 2, 4}}, {'*', {2, 5, 2, 0, 0}}, {'!', {2, 2, 2, 0, 2}},
    {'?', {6, 1, 2, 0, 2}}, {'<', {1, 2, 4, 2, 1}}, {'>', {4, 2, 1, 2, 4}},
    {'=', {0, 7, 0, 7, 0}}, {'\'', {2, 2, 0, 0, 0}}, {'_', {0, 0, 0, 0, 7}},
};

constexpr Glyph kUnknown = {'#', {7, 5, 5, 5, 7}};

const Glyph& glyphFor(char c) {
  const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  for (const Glyph& g : kGlyphs) {
    if (g.ch == upper) {
      return g;
    }
  }
  return kUnknown;
}

}  // namespace

namespace pixelfont {

int textWidth(const std::string& text, int scale) {
  if (text.empty() || scale <= 0) {
    return 0;
  }
  return static_cast<int>(text.size()) * kAdvance * scale - scale;
}

void drawText(Frame& frame, int x, int y, const std::string& text, int scale, uint16_t color,
              Align align) {
  if (scale <= 0) {
    return;
  }
  int cursor = x;
  if (align == Align::kCenter) {
    cursor = x - textWidth(text, scale) / 2;
  } else if (align == Align::kRight) {
    cursor = x - textWidth(text, scale);
  }

  for (char c : text) {
    const Glyph& g = glyphFor(c);
    for (int row = 0; row < kGlyphHeight; ++row) {
      for (int col = 0; col < kGlyphWidth; ++col) {
        if ((g.rows[row] >> (kGlyphWidth - 1 - col)) & 1U) {
          frame.fillRect(cursor + col * scale, y + row * scale, scale, scale, color);
        }
      }
    }
    cursor += kAdvance * scale;
  }
}

}  // namespace pixelfont
