#pragma once

#include "petalite/core/types.hpp"
#include <string>

namespace petalite::cache {

// ============================================================================
// Cache Errors
// ============================================================================

enum class CacheError {
    InvalidConfig,     // No tiers, or a tier with zero size or capacity
    OversizedGlyph,    // Bitmap larger than every tier's cell
    MissingFont,       // Key refers to a font that is not loaded
    TierExhausted      // Every resident cell of the tier is in use by the current batch
};

[[nodiscard]] constexpr const char* to_string(CacheError error) {
    switch (error) {
        case CacheError::InvalidConfig: return "InvalidConfig";
        case CacheError::OversizedGlyph: return "OversizedGlyph";
        case CacheError::MissingFont: return "MissingFont";
        case CacheError::TierExhausted: return "TierExhausted";
    }
    return "Unknown";
}

// ============================================================================
// Tier Configuration
// ============================================================================

// One tier of a CPU cache: `capacity` blocks of `block_size` coverage bytes
struct CpuTierConfig {
    u32 block_size{1024};
    u32 capacity{256};
};

/**
 * @brief One tier of a GPU cache
 *
 * Each tier is its own texture array of `texture_size` squared single
 * channel layers. A layer (page) holds a grid of tiles_per_axis squared
 * tiles of tile_size pixels; up to `pages` layers are used.
 */
struct GpuTierConfig {
    u32 tile_size{32};
    u32 tiles_per_axis{16};
    u32 texture_size{512};
    u32 pages{4};
};

// ============================================================================
// Statistics
// ============================================================================

struct CacheStats {
    u64 hits{0};
    u64 misses{0};
    u64 evictions{0};
    u64 oversized{0};
    u64 raster_failures{0};
};

} // namespace petalite::cache
