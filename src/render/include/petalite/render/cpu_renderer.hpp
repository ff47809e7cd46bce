#pragma once

#include "petalite/cache/cpu_glyph_cache.hpp"
#include "petalite/layout/layout_result.hpp"
#include "petalite/render/coverage_bitmap.hpp"
#include <optional>

namespace petalite::render {

struct RenderStats {
    u32 drawn{0};      // Glyphs resolved and walked
    u32 culled{0};     // Glyphs outside the extent, never resolved
    u32 failed{0};     // Glyphs the cache could not resolve
};

/**
 * @brief Walks a layout and reports covered pixels to a sink
 *
 * The sink is called as sink(PointI position, u8 coverage, const T& payload)
 * once per pixel with non-zero coverage, always inside the given extent.
 * The renderer does no blending; compositing belongs to the sink.
 */
class CpuRenderer {
public:
    explicit CpuRenderer(cache::CpuGlyphCache& cache);

    template<typename T, typename Sink>
    RenderStats render(const layout::LayoutResult<T>& layout, RectI extent, Sink&& sink) {
        RenderStats stats;
        for (const auto& line : layout.lines) {
            for (const auto& glyph : line.glyphs) {
                auto view = prepare(glyph, extent, stats);
                if (!view) {
                    continue;
                }

                const i32 x0 = glyph.origin.x + view->xmin;
                const i32 y0 = glyph.origin.y + view->top();
                RectI visible = RectI(x0, y0, static_cast<i32>(view->width),
                                      static_cast<i32>(view->height)).intersection(extent);

                for (i32 y = visible.top(); y < visible.bottom(); ++y) {
                    const u8* row = view->coverage + static_cast<usize>(y - y0) * view->width;
                    for (i32 x = visible.left(); x < visible.right(); ++x) {
                        u8 coverage = row[x - x0];
                        if (coverage != 0) {
                            sink(PointI(x, y), coverage, glyph.payload);
                        }
                    }
                }
            }
        }
        return stats;
    }

    // Accumulate coverage of every glyph into a bitmap, saturating
    template<typename T>
    RenderStats render_coverage(const layout::LayoutResult<T>& layout, CoverageBitmap& target) {
        return render(layout, target.extent(), [&target](PointI p, u8 coverage, const T&) {
            target.accumulate(static_cast<u32>(p.x), static_cast<u32>(p.y), coverage);
        });
    }

private:
    // Culls and resolves one glyph; nullopt when there is nothing to walk
    [[nodiscard]] std::optional<cache::CpuGlyphView> prepare(const layout::GlyphPlacement& glyph,
                                                             RectI extent, RenderStats& stats);

    cache::CpuGlyphCache& m_cache;
};

} // namespace petalite::render
