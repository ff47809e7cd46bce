#pragma once

#include "petalite/text/glyph_key.hpp"
#include <vector>

namespace petalite::layout {

// Placement of one glyph, independent of any payload
struct GlyphPlacement {
    text::GlyphKey key;
    f32 pen_x{0};          // Exact pen position
    f32 baseline{0};       // Exact baseline of the line
    PointI origin;         // Pen snapped to the pixel grid; the sub-pixel rest is in key
    RectI bounds;          // Conservative ink box in pixels, y down
    u32 element{0};        // Source element index
    u32 cluster{0};        // Source cluster index

    bool operator==(const GlyphPlacement&) const = default;
};

template<typename T>
struct PositionedGlyph : GlyphPlacement {
    T payload{};

    bool operator==(const PositionedGlyph&) const = default;
};

template<typename T>
struct LayoutLine {
    f32 top{0};
    f32 baseline{0};
    f32 height{0};
    f32 width{0};          // Content width, trailing blanks excluded
    f32 x{0};              // Left edge after alignment
    u32 cluster_start{0};
    u32 cluster_end{0};
    bool paragraph_end{false};
    std::vector<PositionedGlyph<T>> glyphs;

    [[nodiscard]] f32 bottom() const { return top + height; }
};

/**
 * @brief Final glyph placement for one TextData
 *
 * Lines are ordered top to bottom; glyphs within a line by pen position.
 */
template<typename T>
struct LayoutResult {
    std::vector<LayoutLine<T>> lines;
    f32 total_width{0};
    f32 total_height{0};

    [[nodiscard]] usize glyph_count() const {
        usize count = 0;
        for (const auto& line : lines) {
            count += line.glyphs.size();
        }
        return count;
    }

    [[nodiscard]] SizeF size() const { return {total_width, total_height}; }
};

// Payload type for payload-free layouts
struct NoPayload {
    constexpr bool operator==(const NoPayload&) const { return true; }
};

} // namespace petalite::layout
