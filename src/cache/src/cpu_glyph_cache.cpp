/**
 * CPU glyph cache implementation
 */

#include "petalite/cache/cpu_glyph_cache.hpp"
#include "petalite/text/font_storage.hpp"

#include <algorithm>

namespace petalite::cache {

Result<std::unique_ptr<CpuGlyphCache>, CacheError>
CpuGlyphCache::create(std::vector<CpuTierConfig> tiers, const text::FontStorage& fonts) {
    auto core = GlyphCacheCore<CpuCellTraits>::create(std::move(tiers));
    if (core.is_err()) {
        return make_error(core.error());
    }
    return std::unique_ptr<CpuGlyphCache>(new CpuGlyphCache(std::move(core).value(), fonts));
}

CpuGlyphCache::CpuGlyphCache(GlyphCacheCore<CpuCellTraits> core, const text::FontStorage& fonts)
    : m_core(std::move(core))
    , m_fonts(fonts)
{
    m_storage.resize(m_core.tier_count());
    for (u32 t = 0; t < m_core.tier_count(); ++t) {
        const CpuTierConfig& config = m_core.tier_config(t);
        m_storage[t].blocks.assign(static_cast<usize>(config.block_size) * config.capacity, 0);
        m_storage[t].slots.resize(config.capacity);
    }
}

CpuGlyphView CpuGlyphCache::view(u32 tier, u32 slot) const {
    const CpuTierConfig& config = m_core.tier_config(tier);
    const SlotInfo& info = m_storage[tier].slots[slot];

    CpuGlyphView out;
    out.coverage = m_storage[tier].blocks.data() + static_cast<usize>(slot) * config.block_size;
    out.width = info.width;
    out.height = info.height;
    out.xmin = info.xmin;
    out.ymin = info.ymin;
    out.tier = tier;
    out.slot = slot;
    return out;
}

Result<CpuGlyphView, CacheError> CpuGlyphCache::resolve(const text::GlyphKey& key) {
    if (auto hit = m_core.lookup(key, 0)) {
        return view(hit->tier, hit->slot);
    }

    auto font = m_fonts.font(key.font);
    if (!font) {
        return make_error(CacheError::MissingFont);
    }

    const f32 size = key.size();
    const f32 x_offset = key.x_offset();
    text::GlyphMetrics metrics = font->glyph_metrics(key.glyph, size, x_offset);

    auto reserved = m_core.reserve(key, metrics.width, metrics.height, 0, false);
    if (reserved.is_err()) {
        return make_error(reserved.error());
    }
    const auto location = reserved.value().location;
    const CpuTierConfig& config = m_core.tier_config(location.tier);

    u8* block = m_storage[location.tier].blocks.data() +
                static_cast<usize>(location.slot) * config.block_size;
    SlotInfo& info = m_storage[location.tier].slots[location.slot];
    info = SlotInfo{};

    auto bitmap = font->rasterize(key.glyph, size, x_offset);
    if (bitmap.is_err()) {
        m_core.note_raster_failure();
        PETALITE_LOG_WARN_FMT("Rasterizing glyph {} of font {} failed: {}",
                              key.glyph, key.font, text::to_string(bitmap.error()));
        return view(location.tier, location.slot);
    }

    const text::GlyphBitmap& raster = bitmap.value();
    const u32 w = raster.metrics.width;
    const u32 h = raster.metrics.height;
    if (!CpuCellTraits::accommodates(config, w, h) || raster.coverage.size() < static_cast<usize>(w) * h) {
        m_core.note_raster_failure();
        PETALITE_LOG_WARN_FMT("Glyph {} of font {} rasterized to {}x{}, larger than its block",
                              key.glyph, key.font, w, h);
        return view(location.tier, location.slot);
    }

    std::copy_n(raster.coverage.data(), static_cast<usize>(w) * h, block);
    info.width = w;
    info.height = h;
    info.xmin = raster.metrics.xmin;
    info.ymin = raster.metrics.ymin;
    return view(location.tier, location.slot);
}

void CpuGlyphCache::clear() {
    m_core.clear();
    for (auto& storage : m_storage) {
        std::fill(storage.slots.begin(), storage.slots.end(), SlotInfo{});
    }
}

} // namespace petalite::cache
