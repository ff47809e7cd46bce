/**
 * GPU renderer implementation
 */

#include "petalite/render/gpu_renderer.hpp"
#include "petalite/core/logger.hpp"

#include <cmath>

namespace petalite::render {

GpuRenderer::GpuRenderer(cache::GpuGlyphCache& cache) : m_cache(cache) {}

void GpuRenderer::begin(SizeF surface, DrawAdapter& adapter) {
    m_stats = GpuRenderStats{};
    m_pending.clear();
    m_pending.resize(m_cache.core().tier_count());
    m_surface = RectI(0, 0, static_cast<i32>(std::ceil(surface.width)),
                      static_cast<i32>(std::ceil(surface.height)));

    m_cache.begin_batch();
    adapter.begin_frame(FrameGlobals{surface, m_cache.atlases()});
}

void GpuRenderer::push(const layout::GlyphPlacement& glyph, ColorF color, DrawAdapter& adapter) {
    if (!glyph.bounds.intersects(m_surface)) {
        ++m_stats.culled;
        return;
    }

    auto resolved = m_cache.resolve(glyph.key);
    if (resolved.is_err() && resolved.error() == cache::CacheError::TierExhausted) {
        PETALITE_LOG_DEBUG("Glyph tier full of in-flight tiles, submitting batch early");
        flush(adapter);
        ++m_stats.flushes;
        m_cache.begin_batch();
        resolved = m_cache.resolve(glyph.key);
    }

    if (resolved.is_err()) {
        if (resolved.error() != cache::CacheError::OversizedGlyph) {
            ++m_stats.failed;
            return;
        }

        auto bitmap = m_cache.rasterize_uncached(glyph.key);
        if (bitmap.is_err()) {
            ++m_stats.failed;
            return;
        }
        const text::GlyphMetrics& metrics = bitmap.value().metrics;
        if (metrics.is_empty()) {
            return;
        }

        StandaloneGlyph standalone;
        standalone.width = metrics.width;
        standalone.height = metrics.height;
        standalone.screen_rect = RectF(static_cast<f32>(glyph.origin.x + metrics.xmin),
                                       static_cast<f32>(glyph.origin.y - (metrics.ymin + static_cast<i32>(metrics.height))),
                                       static_cast<f32>(metrics.width),
                                       static_cast<f32>(metrics.height));
        standalone.color = color;
        standalone.coverage = std::move(bitmap.value().coverage);
        adapter.draw_standalone(standalone);
        ++m_stats.standalone;
        return;
    }

    const cache::GpuGlyphView& view = resolved.value();
    if (view.is_empty()) {
        return;
    }

    DrawInstance instance{};
    instance.screen_rect[0] = static_cast<f32>(glyph.origin.x + view.xmin);
    instance.screen_rect[1] = static_cast<f32>(glyph.origin.y + view.top());
    instance.screen_rect[2] = static_cast<f32>(view.width);
    instance.screen_rect[3] = static_cast<f32>(view.height);
    instance.uv_rect[0] = view.uv.x;
    instance.uv_rect[1] = view.uv.y;
    instance.uv_rect[2] = view.uv.width;
    instance.uv_rect[3] = view.uv.height;
    instance.color[0] = color.r;
    instance.color[1] = color.g;
    instance.color[2] = color.b;
    instance.color[3] = color.a;
    instance.layer = view.layer;

    m_pending[view.atlas].push_back(instance);
    ++m_stats.instances;
}

void GpuRenderer::flush(DrawAdapter& adapter) {
    auto uploads = m_cache.take_uploads();
    if (!uploads.empty()) {
        adapter.upload(uploads);
    }

    for (u32 atlas = 0; atlas < m_pending.size(); ++atlas) {
        auto& instances = m_pending[atlas];
        if (instances.empty()) {
            continue;
        }
        adapter.draw(DrawBatch{atlas, instances});
        ++m_stats.batches;
        instances.clear();
    }
}

GpuRenderStats GpuRenderer::finish(DrawAdapter& adapter) {
    flush(adapter);
    adapter.end_frame();
    return m_stats;
}

} // namespace petalite::render
