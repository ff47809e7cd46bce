#pragma once

#include "petalite/core/types.hpp"
#include <vector>

namespace petalite::render {

// Single channel 8-bit image, top row first
class CoverageBitmap {
public:
    CoverageBitmap() = default;
    CoverageBitmap(u32 width, u32 height)
        : m_width(width)
        , m_height(height)
        , m_pixels(static_cast<usize>(width) * height, 0)
    {
    }

    [[nodiscard]] u32 width() const { return m_width; }
    [[nodiscard]] u32 height() const { return m_height; }
    [[nodiscard]] RectI extent() const {
        return {0, 0, static_cast<i32>(m_width), static_cast<i32>(m_height)};
    }

    [[nodiscard]] u8 at(u32 x, u32 y) const { return m_pixels[static_cast<usize>(y) * m_width + x]; }

    // Saturating add
    void accumulate(u32 x, u32 y, u8 coverage) {
        u8& pixel = m_pixels[static_cast<usize>(y) * m_width + x];
        u32 sum = static_cast<u32>(pixel) + coverage;
        pixel = static_cast<u8>(sum > 255 ? 255 : sum);
    }

    [[nodiscard]] const std::vector<u8>& pixels() const { return m_pixels; }

private:
    u32 m_width{0};
    u32 m_height{0};
    std::vector<u8> m_pixels;
};

} // namespace petalite::render
