#pragma once

#include "petalite/text/font.hpp"
#include <cmath>
#include <functional>

namespace petalite::text {

// Font sizes are stored in 1/256 pixel units inside a key
constexpr f32 SIZE_QUANTUM = 256.0f;

constexpr u32 MAX_SUBPIXEL_POSITIONS = 16;

/**
 * @brief Identity of one rasterized bitmap
 *
 * Two glyphs with equal keys produce identical coverage, whichever text
 * element they came from.
 */
struct GlyphKey {
    FontId font{INVALID_FONT_ID};
    GlyphIndex glyph{0};
    u8 subpixel_bucket{0};
    u8 subpixel_positions{1};
    u32 size_q{0};

    [[nodiscard]] static u32 quantize_size(f32 size) {
        return static_cast<u32>(std::lround(size * SIZE_QUANTUM));
    }

    [[nodiscard]] f32 size() const { return static_cast<f32>(size_q) / SIZE_QUANTUM; }

    // Horizontal sub-pixel shift in [0, 1) the bitmap is rendered with
    [[nodiscard]] f32 x_offset() const {
        if (subpixel_positions <= 1) {
            return 0.0f;
        }
        return static_cast<f32>(subpixel_bucket) / static_cast<f32>(subpixel_positions);
    }

    constexpr bool operator==(const GlyphKey& other) const {
        return font == other.font && glyph == other.glyph &&
               subpixel_bucket == other.subpixel_bucket &&
               subpixel_positions == other.subpixel_positions &&
               size_q == other.size_q;
    }

    constexpr bool operator!=(const GlyphKey& other) const {
        return !(*this == other);
    }
};

struct GlyphKeyHash {
    std::size_t operator()(const GlyphKey& key) const noexcept {
        u64 packed = (static_cast<u64>(key.font) << 32) |
                     (static_cast<u64>(key.glyph) << 16) |
                     (static_cast<u64>(key.subpixel_bucket) << 8) |
                     static_cast<u64>(key.subpixel_positions);
        std::size_t h = std::hash<u64>{}(packed);
        h ^= std::hash<u32>{}(key.size_q) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace petalite::text
