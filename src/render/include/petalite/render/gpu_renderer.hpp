#pragma once

#include "petalite/cache/gpu_glyph_cache.hpp"
#include "petalite/layout/layout_result.hpp"
#include "petalite/render/draw_adapter.hpp"
#include <vector>

namespace petalite::render {

// Converts a glyph payload to its draw color
template<typename T>
struct PayloadColor;

template<>
struct PayloadColor<Color> {
    ColorF operator()(const Color& color) const { return ColorF::from(color); }
};

template<>
struct PayloadColor<ColorF> {
    ColorF operator()(const ColorF& color) const { return color; }
};

struct GpuRenderStats {
    u32 instances{0};
    u32 batches{0};        // draw() calls
    u32 flushes{0};        // Mid-frame submissions forced by a full tier
    u32 standalone{0};
    u32 failed{0};
    u32 culled{0};         // Glyphs outside the surface, never resolved
};

/**
 * @brief Batches a layout into instanced draws through a GpuGlyphCache
 *
 * Every call starts a new cache batch. Glyphs whose bounds miss the surface
 * are skipped before they reach the cache. Instances are grouped by atlas in
 * ascending order and keep layout order inside a group. When a tier runs
 * out of unprotected tiles, the pending uploads and draws are submitted,
 * a new batch begins and the glyph is resolved again.
 */
class GpuRenderer {
public:
    explicit GpuRenderer(cache::GpuGlyphCache& cache);

    template<typename T, typename ColorFn = PayloadColor<T>>
    GpuRenderStats render(const layout::LayoutResult<T>& layout, SizeF surface,
                          DrawAdapter& adapter, ColorFn color_of = ColorFn{}) {
        begin(surface, adapter);
        for (const auto& line : layout.lines) {
            for (const auto& glyph : line.glyphs) {
                push(glyph, color_of(glyph.payload), adapter);
            }
        }
        return finish(adapter);
    }

private:
    void begin(SizeF surface, DrawAdapter& adapter);
    void push(const layout::GlyphPlacement& glyph, ColorF color, DrawAdapter& adapter);
    void flush(DrawAdapter& adapter);
    [[nodiscard]] GpuRenderStats finish(DrawAdapter& adapter);

    cache::GpuGlyphCache& m_cache;
    std::vector<std::vector<DrawInstance>> m_pending;   // Indexed by atlas
    RectI m_surface;
    GpuRenderStats m_stats;
};

} // namespace petalite::render
