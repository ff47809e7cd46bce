#pragma once

#include "petalite/cache/cache_types.hpp"
#include "petalite/text/glyph_key.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

namespace petalite::cache {

struct SlotAcquire {
    u32 slot{0};
    std::optional<text::GlyphKey> evicted;
};

/**
 * @brief Fixed capacity key to slot map with least-recently-used eviction
 *
 * Slots live in an arena indexed by integer and are chained into a doubly
 * linked recency list by index. Promote, insert and evict are O(1). Free
 * slots are handed out lowest index first; once the arena is full every
 * insert reuses the slot of the least recently used key.
 *
 * Each slot remembers the batch in which it was last used. When asked to,
 * acquire() refuses to evict a slot used in the current batch.
 */
class SlotLru {
public:
    static constexpr u32 NIL = 0xFFFFFFFF;

    explicit SlotLru(u32 capacity);

    // Lookup without changing recency
    [[nodiscard]] std::optional<u32> find(const text::GlyphKey& key) const;

    // Lookup; on hit promote to most recently used and stamp the batch
    [[nodiscard]] std::optional<u32> touch(const text::GlyphKey& key, u64 batch);

    // Insert a key that is not resident. Takes a free slot or evicts the
    // least recently used one. Fails with TierExhausted when the victim was
    // used in `batch` and `protect_batch` is set.
    [[nodiscard]] Result<SlotAcquire, CacheError> acquire(const text::GlyphKey& key, u64 batch,
                                                          bool protect_batch);

    void clear();

    [[nodiscard]] u32 capacity() const { return static_cast<u32>(m_nodes.size()); }
    [[nodiscard]] u32 size() const { return m_used; }
    [[nodiscard]] bool is_full() const { return m_used == capacity(); }

    [[nodiscard]] std::optional<text::GlyphKey> key_at(u32 slot) const;
    [[nodiscard]] std::optional<u32> least_recent() const;

    // Resident slots from most to least recently used
    [[nodiscard]] std::vector<u32> recency_order() const;

private:
    struct Node {
        text::GlyphKey key;
        u32 newer{NIL};
        u32 older{NIL};
        u64 last_batch{0};
        bool occupied{false};
    };

    void unlink(u32 slot);
    void push_front(u32 slot);

    std::vector<Node> m_nodes;
    std::unordered_map<text::GlyphKey, u32, text::GlyphKeyHash> m_index;
    u32 m_head{NIL};   // Most recently used
    u32 m_tail{NIL};   // Least recently used
    u32 m_used{0};     // Slots [0, m_used) have been handed out
};

} // namespace petalite::cache
