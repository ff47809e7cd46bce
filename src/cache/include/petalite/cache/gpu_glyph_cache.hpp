#pragma once

#include "petalite/cache/glyph_cache_core.hpp"
#include "petalite/text/font.hpp"
#include <memory>
#include <vector>

namespace petalite::text {
class FontStorage;
}

namespace petalite::cache {

struct GpuCellTraits {
    using TierConfig = GpuTierConfig;

    [[nodiscard]] static bool valid(const TierConfig& tier) {
        return tier.tile_size > 0 && tier.tiles_per_axis > 0 && tier.pages > 0 &&
               static_cast<u64>(tier.tile_size) * tier.tiles_per_axis <= tier.texture_size;
    }
    [[nodiscard]] static u32 tiles_per_page(const TierConfig& tier) {
        return tier.tiles_per_axis * tier.tiles_per_axis;
    }
    [[nodiscard]] static u32 capacity(const TierConfig& tier) {
        return tiles_per_page(tier) * tier.pages;
    }
    [[nodiscard]] static u64 cell_extent(const TierConfig& tier) { return tier.tile_size; }
    [[nodiscard]] static bool accommodates(const TierConfig& tier, u32 width, u32 height) {
        return std::max(width, height) <= tier.tile_size;
    }
};

// One texture array the draw adapter has to provide
struct AtlasDescriptor {
    u32 atlas{0};
    u32 texture_size{0};
    u32 layers{0};         // Maximum layers the atlas may use
    u32 tile_size{0};
};

// Coverage bytes to copy into a texture array layer
struct AtlasUpload {
    u32 atlas{0};
    u32 layer{0};
    u32 x{0};
    u32 y{0};
    u32 width{0};
    u32 height{0};
    std::vector<u8> coverage;   // width * height, top row first
};

/**
 * @brief Resolved glyph tile in a GPU atlas
 *
 * Plain data; stays meaningful until the tile is evicted.
 */
struct GpuGlyphView {
    u32 atlas{0};
    u32 layer{0};
    u32 x{0};
    u32 y{0};
    u32 width{0};
    u32 height{0};
    i32 xmin{0};
    i32 ymin{0};
    RectF uv;              // Normalized texture coordinates of the bitmap
    u32 tier{0};
    u32 slot{0};

    [[nodiscard]] bool is_empty() const { return width == 0 || height == 0; }
    [[nodiscard]] i32 top() const { return -(ymin + static_cast<i32>(height)); }

    bool operator==(const GpuGlyphView&) const = default;
};

/**
 * @brief Glyph cache over tiled texture arrays
 *
 * Tier t is atlas t. Slot s of a tier lives on layer s / tiles_per_page at
 * tile s % tiles_per_page, so layers fill up in order. Freshly filled
 * tiles are queued as AtlasUploads until take_uploads().
 *
 * Entries resolved since the last begin_batch() are protected from
 * eviction, because draws referencing them may not have been submitted
 * yet. resolve() reports TierExhausted when only protected entries are
 * left; submit the batch, call begin_batch() and resolve again.
 */
class GpuGlyphCache {
public:
    [[nodiscard]] static Result<std::unique_ptr<GpuGlyphCache>, CacheError>
    create(std::vector<GpuTierConfig> tiers, const text::FontStorage& fonts);

    void begin_batch() { ++m_batch; }
    [[nodiscard]] u64 batch() const { return m_batch; }

    [[nodiscard]] Result<GpuGlyphView, CacheError> resolve(const text::GlyphKey& key);

    // Rasterize without caching, for glyphs no tier can hold
    [[nodiscard]] Result<text::GlyphBitmap, CacheError> rasterize_uncached(const text::GlyphKey& key) const;

    [[nodiscard]] std::vector<AtlasUpload> take_uploads();
    [[nodiscard]] bool has_pending_uploads() const { return !m_uploads.empty(); }

    [[nodiscard]] std::vector<AtlasDescriptor> atlases() const;

    // Layers of a tier that hold at least one assigned tile
    [[nodiscard]] u32 page_count(u32 tier) const;

    [[nodiscard]] bool contains(const text::GlyphKey& key) const { return m_core.contains(key); }

    void clear();

    [[nodiscard]] const CacheStats& stats() const { return m_core.stats(); }
    [[nodiscard]] const GlyphCacheCore<GpuCellTraits>& core() const { return m_core; }

private:
    struct SlotInfo {
        u32 width{0};
        u32 height{0};
        i32 xmin{0};
        i32 ymin{0};
    };

    GpuGlyphCache(GlyphCacheCore<GpuCellTraits> core, const text::FontStorage& fonts);

    [[nodiscard]] GpuGlyphView view(u32 tier, u32 slot) const;

    GlyphCacheCore<GpuCellTraits> m_core;
    std::vector<std::vector<SlotInfo>> m_slots;
    std::vector<AtlasUpload> m_uploads;
    const text::FontStorage& m_fonts;
    u64 m_batch{1};
};

} // namespace petalite::cache
