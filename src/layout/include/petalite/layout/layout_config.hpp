#pragma once

#include "petalite/core/types.hpp"
#include <optional>

namespace petalite::layout {

enum class HorizontalAlign : u8 {
    Left,
    Center,
    Right,
    Justify
};

enum class VerticalAlign : u8 {
    Top,
    Middle,
    Bottom
};

enum class WrapStyle : u8 {
    NoWrap,     // Lines only end at hard breaks; overflow is allowed
    WordWrap,   // Break at opportunities; an unbreakable run gets its own line
    CharWrap    // Like WordWrap, but an unbreakable run is split between clusters
};

[[nodiscard]] constexpr const char* to_string(WrapStyle style) {
    switch (style) {
        case WrapStyle::NoWrap: return "NoWrap";
        case WrapStyle::WordWrap: return "WordWrap";
        case WrapStyle::CharWrap: return "CharWrap";
    }
    return "Unknown";
}

/**
 * @brief Inputs that shape the arrangement of a TextData
 */
struct TextLayoutConfig {
    std::optional<f32> max_width;
    std::optional<f32> max_height;   // Lines whose bottom exceeds this are dropped

    HorizontalAlign horizontal_align{HorizontalAlign::Left};
    VerticalAlign vertical_align{VerticalAlign::Top};

    f32 line_height_scale{1.0f};
    WrapStyle wrap_style{WrapStyle::WordWrap};

    f32 tab_width{4.0f};             // Tab stop interval in space advances
    f32 letter_spacing{0.0f};        // Added after every cluster
    u32 subpixel_positions{4};       // Horizontal phase buckets per pixel, 1..16
};

} // namespace petalite::layout
