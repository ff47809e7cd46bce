/**
 * GPU glyph cache implementation
 */

#include "petalite/cache/gpu_glyph_cache.hpp"
#include "petalite/text/font_storage.hpp"

namespace petalite::cache {

Result<std::unique_ptr<GpuGlyphCache>, CacheError>
GpuGlyphCache::create(std::vector<GpuTierConfig> tiers, const text::FontStorage& fonts) {
    auto core = GlyphCacheCore<GpuCellTraits>::create(std::move(tiers));
    if (core.is_err()) {
        return make_error(core.error());
    }
    return std::unique_ptr<GpuGlyphCache>(new GpuGlyphCache(std::move(core).value(), fonts));
}

GpuGlyphCache::GpuGlyphCache(GlyphCacheCore<GpuCellTraits> core, const text::FontStorage& fonts)
    : m_core(std::move(core))
    , m_fonts(fonts)
{
    m_slots.resize(m_core.tier_count());
    for (u32 t = 0; t < m_core.tier_count(); ++t) {
        m_slots[t].resize(GpuCellTraits::capacity(m_core.tier_config(t)));
    }
}

GpuGlyphView GpuGlyphCache::view(u32 tier, u32 slot) const {
    const GpuTierConfig& config = m_core.tier_config(tier);
    const SlotInfo& info = m_slots[tier][slot];
    const u32 per_page = GpuCellTraits::tiles_per_page(config);
    const u32 index = slot % per_page;
    const auto texture = static_cast<f32>(config.texture_size);

    GpuGlyphView out;
    out.atlas = tier;
    out.layer = slot / per_page;
    out.x = (index % config.tiles_per_axis) * config.tile_size;
    out.y = (index / config.tiles_per_axis) * config.tile_size;
    out.width = info.width;
    out.height = info.height;
    out.xmin = info.xmin;
    out.ymin = info.ymin;
    out.uv = RectF(static_cast<f32>(out.x) / texture,
                   static_cast<f32>(out.y) / texture,
                   static_cast<f32>(out.width) / texture,
                   static_cast<f32>(out.height) / texture);
    out.tier = tier;
    out.slot = slot;
    return out;
}

Result<GpuGlyphView, CacheError> GpuGlyphCache::resolve(const text::GlyphKey& key) {
    if (auto hit = m_core.lookup(key, m_batch)) {
        return view(hit->tier, hit->slot);
    }

    auto font = m_fonts.font(key.font);
    if (!font) {
        return make_error(CacheError::MissingFont);
    }

    const f32 size = key.size();
    const f32 x_offset = key.x_offset();
    text::GlyphMetrics metrics = font->glyph_metrics(key.glyph, size, x_offset);

    auto reserved = m_core.reserve(key, metrics.width, metrics.height, m_batch, true);
    if (reserved.is_err()) {
        return make_error(reserved.error());
    }
    const auto location = reserved.value().location;
    const GpuTierConfig& config = m_core.tier_config(location.tier);

    SlotInfo& info = m_slots[location.tier][location.slot];
    info = SlotInfo{};

    auto bitmap = font->rasterize(key.glyph, size, x_offset);
    if (bitmap.is_err()) {
        m_core.note_raster_failure();
        PETALITE_LOG_WARN_FMT("Rasterizing glyph {} of font {} failed: {}",
                              key.glyph, key.font, text::to_string(bitmap.error()));
        return view(location.tier, location.slot);
    }

    text::GlyphBitmap& raster = bitmap.value();
    const u32 w = raster.metrics.width;
    const u32 h = raster.metrics.height;
    if (!GpuCellTraits::accommodates(config, w, h) || raster.coverage.size() < static_cast<usize>(w) * h) {
        m_core.note_raster_failure();
        PETALITE_LOG_WARN_FMT("Glyph {} of font {} rasterized to {}x{}, larger than its tile",
                              key.glyph, key.font, w, h);
        return view(location.tier, location.slot);
    }

    info.width = w;
    info.height = h;
    info.xmin = raster.metrics.xmin;
    info.ymin = raster.metrics.ymin;

    GpuGlyphView out = view(location.tier, location.slot);
    if (!out.is_empty()) {
        raster.coverage.resize(static_cast<usize>(w) * h);
        m_uploads.push_back(AtlasUpload{out.atlas, out.layer, out.x, out.y, w, h,
                                        std::move(raster.coverage)});
    }
    return out;
}

Result<text::GlyphBitmap, CacheError> GpuGlyphCache::rasterize_uncached(const text::GlyphKey& key) const {
    auto font = m_fonts.font(key.font);
    if (!font) {
        return make_error(CacheError::MissingFont);
    }

    auto bitmap = font->rasterize(key.glyph, key.size(), key.x_offset());
    if (bitmap.is_err()) {
        PETALITE_LOG_WARN_FMT("Rasterizing glyph {} of font {} failed: {}",
                              key.glyph, key.font, text::to_string(bitmap.error()));
        return text::GlyphBitmap{};
    }
    return std::move(bitmap).value();
}

std::vector<AtlasUpload> GpuGlyphCache::take_uploads() {
    std::vector<AtlasUpload> out;
    out.swap(m_uploads);
    return out;
}

std::vector<AtlasDescriptor> GpuGlyphCache::atlases() const {
    std::vector<AtlasDescriptor> out;
    out.reserve(m_core.tier_count());
    for (u32 t = 0; t < m_core.tier_count(); ++t) {
        const GpuTierConfig& config = m_core.tier_config(t);
        out.push_back({t, config.texture_size, config.pages, config.tile_size});
    }
    return out;
}

u32 GpuGlyphCache::page_count(u32 tier) const {
    const GpuTierConfig& config = m_core.tier_config(tier);
    const u32 per_page = GpuCellTraits::tiles_per_page(config);
    const u32 used = m_core.tier_slots(tier).size();
    return (used + per_page - 1) / per_page;
}

void GpuGlyphCache::clear() {
    m_core.clear();
    m_uploads.clear();
    for (auto& slots : m_slots) {
        std::fill(slots.begin(), slots.end(), SlotInfo{});
    }
}

} // namespace petalite::cache
