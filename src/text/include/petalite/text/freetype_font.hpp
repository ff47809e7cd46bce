#pragma once

#include "petalite/text/font.hpp"
#include <memory>
#include <string>
#include <vector>

namespace petalite::text {

/**
 * @brief Font implementation backed by a FreeType face
 *
 * Each instance owns its own FT_Library and serializes face access
 * with an internal mutex.
 */
class FreeTypeFont : public Font {
public:
    ~FreeTypeFont() override;

    FreeTypeFont(const FreeTypeFont&) = delete;
    FreeTypeFont& operator=(const FreeTypeFont&) = delete;

    [[nodiscard]] static Result<std::unique_ptr<FreeTypeFont>, FontError>
    load_file(const std::string& path, u32 face_index = 0);

    [[nodiscard]] static Result<std::unique_ptr<FreeTypeFont>, FontError>
    load_memory(std::vector<u8> data, u32 face_index = 0);

    [[nodiscard]] const std::string& family() const override;
    [[nodiscard]] GlyphIndex glyph_index(unicode::CodePoint cp) const override;
    [[nodiscard]] LineMetrics line_metrics(f32 size) const override;
    [[nodiscard]] GlyphMetrics glyph_metrics(GlyphIndex glyph, f32 size,
                                             f32 x_offset = 0.0f) const override;
    [[nodiscard]] f32 kerning(GlyphIndex left, GlyphIndex right, f32 size) const override;
    [[nodiscard]] Result<GlyphBitmap, FontError> rasterize(GlyphIndex glyph, f32 size,
                                                           f32 x_offset) const override;

    [[nodiscard]] bool has_kerning() const;

private:
    struct Impl;
    explicit FreeTypeFont(std::unique_ptr<Impl> impl);

    [[nodiscard]] static Result<std::unique_ptr<Impl>, FontError> create_impl();

    std::unique_ptr<Impl> m_impl;
};

} // namespace petalite::text
