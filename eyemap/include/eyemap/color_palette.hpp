// Centralized color palette for eyemap rendering
// Edit these colors to customize the appearance of the eyemaps
//
// All colors are 8-bit RGB

#ifndef EYEMAP_COLOR_PALETTE_HPP
#define EYEMAP_COLOR_PALETTE_HPP

#include <eyemap/types.hpp>
#include <array>

namespace eyemap::colors {

// =============================================================================
// DATA GRADIENT (low -> high, light to dark red)
// =============================================================================

constexpr std::array<Color, 5> GRADIENT = {{
    {0xfe, 0xe5, 0xd9},  // #fee5d9
    {0xfc, 0xbb, 0xa1},  // #fcbba1
    {0xfc, 0x92, 0x72},  // #fc9272
    {0xfb, 0x6a, 0x4a},  // #fb6a4a
    {0xcb, 0x18, 0x1d},  // #cb181d
}};

// =============================================================================
// FIXED STATUS COLORS (never produced by the gradient)
// =============================================================================

// Column in the region but nothing observed
constexpr Color WHITE = {0xff, 0xff, 0xff};

// Column outside the rendered region/side
constexpr Color DARK_GRAY = {0x99, 0x99, 0x99};

// =============================================================================
// DECORATION
// =============================================================================

constexpr Color BACKGROUND = {0xff, 0xff, 0xff};
constexpr Color HEX_OUTLINE = {0x66, 0x66, 0x66};
constexpr Color TEXT = {0x33, 0x33, 0x33};

} // namespace eyemap::colors

#endif // EYEMAP_COLOR_PALETTE_HPP
