#pragma once

#include "petalite/core/types.hpp"
#include "petalite/core/unicode.hpp"
#include <string>
#include <vector>

namespace petalite::text {

// Opaque handle issued by FontStorage. Zero is never issued.
using FontId = u32;
constexpr FontId INVALID_FONT_ID = 0;

// Glyph index inside a face. Zero is the .notdef glyph.
using GlyphIndex = u16;

// ============================================================================
// Font Errors
// ============================================================================

enum class FontError {
    NotFound,
    InvalidData,
    LoadFailed,
    RasterizationFailed
};

[[nodiscard]] constexpr const char* to_string(FontError error) {
    switch (error) {
        case FontError::NotFound: return "NotFound";
        case FontError::InvalidData: return "InvalidData";
        case FontError::LoadFailed: return "LoadFailed";
        case FontError::RasterizationFailed: return "RasterizationFailed";
    }
    return "Unknown";
}

// ============================================================================
// Metrics
// ============================================================================

struct LineMetrics {
    f32 ascent{0};      // Distance from baseline to top
    f32 descent{0};     // Distance from baseline to bottom (negative)
    f32 line_gap{0};    // Extra spacing between lines

    [[nodiscard]] f32 line_height() const { return ascent - descent + line_gap; }
};

/**
 * @brief Pixel-aligned ink box of a glyph at a given size and offset
 *
 * xmin is relative to the integer pen origin, ymin to the baseline with
 * y pointing up. The rasterized bitmap covers exactly this box.
 */
struct GlyphMetrics {
    f32 advance{0};
    i32 xmin{0};
    i32 ymin{0};
    u32 width{0};
    u32 height{0};

    [[nodiscard]] bool is_empty() const { return width == 0 || height == 0; }
};

struct GlyphBitmap {
    GlyphMetrics metrics;
    std::vector<u8> coverage;  // width * height bytes, top row first
};

// ============================================================================
// Font
// ============================================================================

/**
 * @brief A loaded font face
 *
 * Implementations must be safe to call from several threads at once.
 */
class Font {
public:
    virtual ~Font() = default;

    [[nodiscard]] virtual const std::string& family() const = 0;

    // Returns 0 when the face has no glyph for the code point
    [[nodiscard]] virtual GlyphIndex glyph_index(unicode::CodePoint cp) const = 0;

    [[nodiscard]] virtual LineMetrics line_metrics(f32 size) const = 0;

    // x_offset is the horizontal sub-pixel shift in [0, 1)
    [[nodiscard]] virtual GlyphMetrics glyph_metrics(GlyphIndex glyph, f32 size,
                                                     f32 x_offset = 0.0f) const = 0;

    // Pair adjustment in pixels, added to the advance of the left glyph
    [[nodiscard]] virtual f32 kerning(GlyphIndex left, GlyphIndex right, f32 size) const = 0;

    [[nodiscard]] virtual Result<GlyphBitmap, FontError> rasterize(GlyphIndex glyph, f32 size,
                                                                   f32 x_offset) const = 0;

protected:
    Font() = default;
};

} // namespace petalite::text
