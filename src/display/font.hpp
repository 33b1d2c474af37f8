#pragma once

#include <array>
#include <cstdint>

// 5x7 column font. Each glyph is five column bytes, bit 0 is the top row.
constexpr int GLYPH_WIDTH   = 5;
constexpr int GLYPH_HEIGHT  = 7;
constexpr int GLYPH_ADVANCE = 6;   // one blank column between glyphs

using Glyph = std::array<uint8_t, GLYPH_WIDTH>;

// Glyph for c (case-insensitive). Characters without a glyph render blank.
const Glyph& glyph_for(char c);
