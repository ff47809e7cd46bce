/**
 * FreeType font implementation
 *
 * Glyphs are loaded unhinted as outlines. The outline is shifted by the
 * sub-pixel offset, its control box is snapped outward to whole pixels and
 * the bitmap is rendered into exactly that box, so glyph_metrics() and
 * rasterize() always agree.
 */

#include "petalite/text/freetype_font.hpp"
#include "petalite/core/logger.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H

#include <cmath>
#include <mutex>

namespace petalite::text {

namespace {

constexpr FT_Int32 LOAD_FLAGS = FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP;

i32 floor_pixels(FT_Pos value) {
    return static_cast<i32>(std::floor(static_cast<f64>(value) / 64.0));
}

i32 ceil_pixels(FT_Pos value) {
    return static_cast<i32>(std::ceil(static_cast<f64>(value) / 64.0));
}

} // anonymous namespace

// ============================================================================
// Impl
// ============================================================================

struct FreeTypeFont::Impl {
    FT_Library library{nullptr};
    FT_Face face{nullptr};
    std::vector<u8> data;  // Backing store for memory faces
    std::string family;
    mutable std::mutex mutex;

    ~Impl() {
        if (face) {
            FT_Done_Face(face);
        }
        if (library) {
            FT_Done_FreeType(library);
        }
    }

    // Caller holds the mutex
    [[nodiscard]] bool set_size(f32 size) const {
        auto char_size = static_cast<FT_F26Dot6>(std::lround(size * 64.0f));
        return FT_Set_Char_Size(face, 0, char_size, 72, 72) == 0;
    }

    // Caller holds the mutex. Leaves the shifted outline in face->glyph.
    [[nodiscard]] bool load_outline(GlyphIndex glyph, f32 size, f32 x_offset,
                                    GlyphMetrics& out) const {
        if (!set_size(size)) {
            return false;
        }
        if (FT_Load_Glyph(face, glyph, LOAD_FLAGS) != 0) {
            return false;
        }

        FT_GlyphSlot slot = face->glyph;
        out.advance = static_cast<f32>(slot->linearHoriAdvance) / 65536.0f;

        if (slot->format != FT_GLYPH_FORMAT_OUTLINE || slot->outline.n_points == 0) {
            out.xmin = out.ymin = 0;
            out.width = out.height = 0;
            return true;
        }

        FT_Outline_Translate(&slot->outline, static_cast<FT_Pos>(std::lround(x_offset * 64.0f)), 0);

        FT_BBox cbox;
        FT_Outline_Get_CBox(&slot->outline, &cbox);

        i32 x0 = floor_pixels(cbox.xMin);
        i32 y0 = floor_pixels(cbox.yMin);
        i32 x1 = ceil_pixels(cbox.xMax);
        i32 y1 = ceil_pixels(cbox.yMax);

        out.xmin = x0;
        out.ymin = y0;
        out.width = static_cast<u32>(std::max(0, x1 - x0));
        out.height = static_cast<u32>(std::max(0, y1 - y0));
        return true;
    }
};

// ============================================================================
// Construction
// ============================================================================

FreeTypeFont::FreeTypeFont(std::unique_ptr<Impl> impl) : m_impl(std::move(impl)) {}

FreeTypeFont::~FreeTypeFont() = default;

Result<std::unique_ptr<FreeTypeFont::Impl>, FontError> FreeTypeFont::create_impl() {
    auto impl = std::make_unique<FreeTypeFont::Impl>();
    if (FT_Init_FreeType(&impl->library) != 0) {
        impl->library = nullptr;
        PETALITE_LOG_ERROR("Failed to initialize FreeType");
        return make_error(FontError::LoadFailed);
    }
    return impl;
}

namespace {

FontError classify(FT_Error error) {
    switch (error) {
        case FT_Err_Cannot_Open_Resource: return FontError::NotFound;
        case FT_Err_Unknown_File_Format:
        case FT_Err_Invalid_File_Format: return FontError::InvalidData;
        default: return FontError::LoadFailed;
    }
}

} // anonymous namespace

Result<std::unique_ptr<FreeTypeFont>, FontError>
FreeTypeFont::load_file(const std::string& path, u32 face_index) {
    auto impl = create_impl();
    if (impl.is_err()) {
        return make_error(impl.error());
    }
    auto state = std::move(impl).value();

    FT_Error error = FT_New_Face(state->library, path.c_str(),
                                 static_cast<FT_Long>(face_index), &state->face);
    if (error != 0) {
        state->face = nullptr;
        return make_error(classify(error));
    }

    state->family = state->face->family_name ? state->face->family_name : "";
    return std::unique_ptr<FreeTypeFont>(new FreeTypeFont(std::move(state)));
}

Result<std::unique_ptr<FreeTypeFont>, FontError>
FreeTypeFont::load_memory(std::vector<u8> data, u32 face_index) {
    if (data.empty()) {
        return make_error(FontError::InvalidData);
    }

    auto impl = create_impl();
    if (impl.is_err()) {
        return make_error(impl.error());
    }
    auto state = std::move(impl).value();
    state->data = std::move(data);

    FT_Error error = FT_New_Memory_Face(state->library,
                                        state->data.data(),
                                        static_cast<FT_Long>(state->data.size()),
                                        static_cast<FT_Long>(face_index),
                                        &state->face);
    if (error != 0) {
        state->face = nullptr;
        return make_error(classify(error));
    }

    state->family = state->face->family_name ? state->face->family_name : "";
    return std::unique_ptr<FreeTypeFont>(new FreeTypeFont(std::move(state)));
}

// ============================================================================
// Font interface
// ============================================================================

const std::string& FreeTypeFont::family() const {
    return m_impl->family;
}

GlyphIndex FreeTypeFont::glyph_index(unicode::CodePoint cp) const {
    std::lock_guard lock(m_impl->mutex);
    FT_UInt index = FT_Get_Char_Index(m_impl->face, static_cast<FT_ULong>(cp));
    // Faces beyond 65535 glyphs are not addressable by GlyphIndex
    if (index > 0xFFFF) {
        return 0;
    }
    return static_cast<GlyphIndex>(index);
}

LineMetrics FreeTypeFont::line_metrics(f32 size) const {
    std::lock_guard lock(m_impl->mutex);
    FT_Face face = m_impl->face;

    LineMetrics metrics;
    if (FT_IS_SCALABLE(face) && face->units_per_EM > 0) {
        f32 scale = size / static_cast<f32>(face->units_per_EM);
        metrics.ascent = static_cast<f32>(face->ascender) * scale;
        metrics.descent = static_cast<f32>(face->descender) * scale;
        f32 height = static_cast<f32>(face->height) * scale;
        metrics.line_gap = std::max(0.0f, height - (metrics.ascent - metrics.descent));
        return metrics;
    }

    if (!m_impl->set_size(size)) {
        return metrics;
    }
    const FT_Size_Metrics& sm = face->size->metrics;
    metrics.ascent = static_cast<f32>(sm.ascender) / 64.0f;
    metrics.descent = static_cast<f32>(sm.descender) / 64.0f;
    metrics.line_gap = std::max(0.0f, static_cast<f32>(sm.height) / 64.0f -
                                      (metrics.ascent - metrics.descent));
    return metrics;
}

GlyphMetrics FreeTypeFont::glyph_metrics(GlyphIndex glyph, f32 size, f32 x_offset) const {
    std::lock_guard lock(m_impl->mutex);
    GlyphMetrics metrics;
    if (!m_impl->load_outline(glyph, size, x_offset, metrics)) {
        return GlyphMetrics{};
    }
    return metrics;
}

f32 FreeTypeFont::kerning(GlyphIndex left, GlyphIndex right, f32 size) const {
    std::lock_guard lock(m_impl->mutex);
    FT_Face face = m_impl->face;
    if (!FT_HAS_KERNING(face) || !m_impl->set_size(size)) {
        return 0.0f;
    }

    FT_Vector delta;
    if (FT_Get_Kerning(face, left, right, FT_KERNING_UNFITTED, &delta) != 0) {
        return 0.0f;
    }
    return static_cast<f32>(delta.x) / 64.0f;
}

bool FreeTypeFont::has_kerning() const {
    return FT_HAS_KERNING(m_impl->face);
}

Result<GlyphBitmap, FontError> FreeTypeFont::rasterize(GlyphIndex glyph, f32 size,
                                                       f32 x_offset) const {
    std::lock_guard lock(m_impl->mutex);

    GlyphBitmap bitmap;
    if (!m_impl->load_outline(glyph, size, x_offset, bitmap.metrics)) {
        return make_error(FontError::RasterizationFailed);
    }
    if (bitmap.metrics.is_empty()) {
        return bitmap;
    }

    const u32 width = bitmap.metrics.width;
    const u32 height = bitmap.metrics.height;
    bitmap.coverage.assign(static_cast<usize>(width) * height, 0);

    FT_Outline* outline = &m_impl->face->glyph->outline;
    FT_Outline_Translate(outline,
                         -static_cast<FT_Pos>(bitmap.metrics.xmin) * 64,
                         -static_cast<FT_Pos>(bitmap.metrics.ymin) * 64);

    FT_Bitmap target;
    target.rows = height;
    target.width = width;
    target.pitch = static_cast<int>(width);
    target.buffer = bitmap.coverage.data();
    target.num_grays = 256;
    target.pixel_mode = FT_PIXEL_MODE_GRAY;
    target.palette_mode = 0;
    target.palette = nullptr;

    if (FT_Outline_Get_Bitmap(m_impl->library, outline, &target) != 0) {
        return make_error(FontError::RasterizationFailed);
    }
    return bitmap;
}

} // namespace petalite::text
