/**
 * CPU renderer implementation
 */

#include "petalite/render/cpu_renderer.hpp"
#include "petalite/core/logger.hpp"

namespace petalite::render {

CpuRenderer::CpuRenderer(cache::CpuGlyphCache& cache) : m_cache(cache) {}

std::optional<cache::CpuGlyphView> CpuRenderer::prepare(const layout::GlyphPlacement& glyph,
                                                         RectI extent, RenderStats& stats) {
    if (!glyph.bounds.intersects(extent)) {
        ++stats.culled;
        return std::nullopt;
    }

    auto resolved = m_cache.resolve(glyph.key);
    if (resolved.is_err()) {
        ++stats.failed;
        PETALITE_LOG_DEBUG_FMT("Skipping glyph {}: {}", glyph.key.glyph,
                               cache::to_string(resolved.error()));
        return std::nullopt;
    }

    ++stats.drawn;
    if (resolved.value().is_empty()) {
        return std::nullopt;
    }
    return resolved.value();
}

} // namespace petalite::render
