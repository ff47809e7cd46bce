#pragma once

#include "petalite/cache/slot_lru.hpp"
#include "petalite/core/logger.hpp"
#include <algorithm>
#include <vector>

namespace petalite::cache {

/**
 * @brief Tier selection and recency bookkeeping shared by every cache
 *
 * Traits describe the cell of one tier:
 *   using TierConfig = ...;
 *   static bool valid(const TierConfig&);
 *   static u32 capacity(const TierConfig&);
 *   static u64 cell_extent(const TierConfig&);          // sort key
 *   static bool accommodates(const TierConfig&, u32 w, u32 h);
 *
 * The core never touches pixels. A specialization looks a key up, and on
 * a miss reserves a cell here, then rasterizes into the storage behind
 * (tier, slot) before handing out a handle.
 */
template<typename Traits>
class GlyphCacheCore {
public:
    using TierConfig = typename Traits::TierConfig;

    struct Location {
        u32 tier{0};
        u32 slot{0};

        bool operator==(const Location&) const = default;
    };

    struct Reservation {
        Location location;
        std::optional<text::GlyphKey> evicted;
    };

    // Tiers are sorted by cell extent, smallest first
    [[nodiscard]] static Result<GlyphCacheCore, CacheError> create(std::vector<TierConfig> tiers) {
        if (tiers.empty()) {
            PETALITE_LOG_ERROR("Glyph cache needs at least one tier");
            return make_error(CacheError::InvalidConfig);
        }
        for (const auto& tier : tiers) {
            if (!Traits::valid(tier)) {
                PETALITE_LOG_ERROR("Glyph cache tier has an invalid configuration");
                return make_error(CacheError::InvalidConfig);
            }
        }

        std::stable_sort(tiers.begin(), tiers.end(), [](const TierConfig& a, const TierConfig& b) {
            return Traits::cell_extent(a) < Traits::cell_extent(b);
        });

        GlyphCacheCore core;
        core.m_tiers.reserve(tiers.size());
        for (const auto& tier : tiers) {
            core.m_tiers.push_back(Tier{tier, SlotLru(Traits::capacity(tier))});
        }
        return core;
    }

    // Resident lookup in any tier; promotes on hit
    [[nodiscard]] std::optional<Location> lookup(const text::GlyphKey& key, u64 batch) {
        for (u32 t = 0; t < m_tiers.size(); ++t) {
            if (auto slot = m_tiers[t].lru.touch(key, batch)) {
                ++m_stats.hits;
                return Location{t, *slot};
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] bool contains(const text::GlyphKey& key) const {
        return std::any_of(m_tiers.begin(), m_tiers.end(), [&](const Tier& tier) {
            return tier.lru.find(key).has_value();
        });
    }

    // Smallest tier whose cell holds a width x height bitmap
    [[nodiscard]] std::optional<u32> select_tier(u32 width, u32 height) const {
        for (u32 t = 0; t < m_tiers.size(); ++t) {
            if (Traits::accommodates(m_tiers[t].config, width, height)) {
                return t;
            }
        }
        return std::nullopt;
    }

    // Claim a cell for a key that missed. The evicted key, if any, is gone
    // from the index when this returns.
    [[nodiscard]] Result<Reservation, CacheError> reserve(const text::GlyphKey& key,
                                                          u32 width, u32 height,
                                                          u64 batch, bool protect_batch) {
        auto tier = select_tier(width, height);
        if (!tier) {
            ++m_stats.oversized;
            return make_error(CacheError::OversizedGlyph);
        }

        auto acquired = m_tiers[*tier].lru.acquire(key, batch, protect_batch);
        if (acquired.is_err()) {
            return make_error(acquired.error());
        }

        ++m_stats.misses;
        if (acquired.value().evicted) {
            ++m_stats.evictions;
        }
        return Reservation{Location{*tier, acquired.value().slot}, acquired.value().evicted};
    }

    void note_raster_failure() { ++m_stats.raster_failures; }

    void clear() {
        for (auto& tier : m_tiers) {
            tier.lru.clear();
        }
    }

    [[nodiscard]] u32 tier_count() const { return static_cast<u32>(m_tiers.size()); }
    [[nodiscard]] const TierConfig& tier_config(u32 tier) const { return m_tiers[tier].config; }
    [[nodiscard]] const SlotLru& tier_slots(u32 tier) const { return m_tiers[tier].lru; }
    [[nodiscard]] const CacheStats& stats() const { return m_stats; }

private:
    struct Tier {
        TierConfig config;
        SlotLru lru;
    };

    GlyphCacheCore() = default;

    std::vector<Tier> m_tiers;
    CacheStats m_stats;
};

} // namespace petalite::cache
