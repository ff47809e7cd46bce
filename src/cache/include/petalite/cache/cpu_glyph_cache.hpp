#pragma once

#include "petalite/cache/glyph_cache_core.hpp"
#include <memory>
#include <vector>

namespace petalite::text {
class FontStorage;
}

namespace petalite::cache {

struct CpuCellTraits {
    using TierConfig = CpuTierConfig;

    [[nodiscard]] static bool valid(const TierConfig& tier) {
        return tier.block_size > 0 && tier.capacity > 0;
    }
    [[nodiscard]] static u32 capacity(const TierConfig& tier) { return tier.capacity; }
    [[nodiscard]] static u64 cell_extent(const TierConfig& tier) { return tier.block_size; }
    [[nodiscard]] static bool accommodates(const TierConfig& tier, u32 width, u32 height) {
        return static_cast<u64>(width) * height <= tier.block_size;
    }
};

/**
 * @brief Resolved glyph bitmap in a CPU cache block
 *
 * `coverage` points into the cache and stays valid until the next call
 * that may evict (resolve() or clear()).
 */
struct CpuGlyphView {
    const u8* coverage{nullptr};
    u32 width{0};
    u32 height{0};
    i32 xmin{0};       // Left edge relative to the glyph origin
    i32 ymin{0};       // Bottom edge relative to the baseline, y up
    u32 tier{0};
    u32 slot{0};

    [[nodiscard]] bool is_empty() const { return width == 0 || height == 0; }

    // Top edge in y down coordinates, relative to the baseline
    [[nodiscard]] i32 top() const { return -(ymin + static_cast<i32>(height)); }
};

/**
 * @brief Glyph cache over flat coverage buffers
 *
 * Each tier owns one buffer of capacity * block_size bytes. A glyph is
 * stored row-major at the start of its block; eviction overwrites the
 * block in place.
 */
class CpuGlyphCache {
public:
    [[nodiscard]] static Result<std::unique_ptr<CpuGlyphCache>, CacheError>
    create(std::vector<CpuTierConfig> tiers, const text::FontStorage& fonts);

    [[nodiscard]] Result<CpuGlyphView, CacheError> resolve(const text::GlyphKey& key);

    [[nodiscard]] bool contains(const text::GlyphKey& key) const { return m_core.contains(key); }

    void clear();

    [[nodiscard]] const CacheStats& stats() const { return m_core.stats(); }
    [[nodiscard]] const GlyphCacheCore<CpuCellTraits>& core() const { return m_core; }

private:
    struct SlotInfo {
        u32 width{0};
        u32 height{0};
        i32 xmin{0};
        i32 ymin{0};
    };

    struct TierStorage {
        std::vector<u8> blocks;
        std::vector<SlotInfo> slots;
    };

    CpuGlyphCache(GlyphCacheCore<CpuCellTraits> core, const text::FontStorage& fonts);

    [[nodiscard]] CpuGlyphView view(u32 tier, u32 slot) const;

    GlyphCacheCore<CpuCellTraits> m_core;
    std::vector<TierStorage> m_storage;
    const text::FontStorage& m_fonts;
};

} // namespace petalite::cache
