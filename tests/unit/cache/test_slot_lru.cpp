#include <gtest/gtest.h>
#include "petalite/cache/slot_lru.hpp"
#include <set>

using namespace petalite;
using namespace petalite::cache;

namespace {

text::GlyphKey key(text::GlyphIndex glyph) {
    text::GlyphKey k;
    k.font = 1;
    k.glyph = glyph;
    k.size_q = text::GlyphKey::quantize_size(16.0f);
    return k;
}

} // anonymous namespace

TEST(SlotLruTest, FreeSlotsAreHandedOutInOrder) {
    SlotLru lru(4);
    for (u32 i = 0; i < 4; ++i) {
        auto acquired = lru.acquire(key(static_cast<text::GlyphIndex>(i)), 0, false);
        ASSERT_TRUE(acquired.is_ok());
        EXPECT_EQ(acquired.value().slot, i);
        EXPECT_FALSE(acquired.value().evicted.has_value());
    }
    EXPECT_TRUE(lru.is_full());
    EXPECT_EQ(lru.size(), 4u);
}

TEST(SlotLruTest, EvictsLeastRecentlyUsed) {
    SlotLru lru(3);
    ASSERT_TRUE(lru.acquire(key(1), 0, false).is_ok());
    ASSERT_TRUE(lru.acquire(key(2), 0, false).is_ok());
    ASSERT_TRUE(lru.acquire(key(3), 0, false).is_ok());

    // Touching 1 leaves 2 as the oldest
    EXPECT_EQ(lru.touch(key(1), 0), 0u);

    auto acquired = lru.acquire(key(4), 0, false);
    ASSERT_TRUE(acquired.is_ok());
    EXPECT_EQ(acquired.value().slot, 1u);
    ASSERT_TRUE(acquired.value().evicted.has_value());
    EXPECT_EQ(*acquired.value().evicted, key(2));

    EXPECT_FALSE(lru.find(key(2)).has_value());
    EXPECT_EQ(lru.find(key(4)), 1u);
    EXPECT_EQ(lru.key_at(1), key(4));
}

TEST(SlotLruTest, RecencyOrderIsMostRecentFirst) {
    SlotLru lru(3);
    ASSERT_TRUE(lru.acquire(key(1), 0, false).is_ok());
    ASSERT_TRUE(lru.acquire(key(2), 0, false).is_ok());
    ASSERT_TRUE(lru.acquire(key(3), 0, false).is_ok());
    EXPECT_EQ(lru.recency_order(), (std::vector<u32>{2, 1, 0}));

    (void)lru.touch(key(2), 0);
    EXPECT_EQ(lru.recency_order(), (std::vector<u32>{1, 2, 0}));
    EXPECT_EQ(lru.least_recent(), 0u);
}

TEST(SlotLruTest, FindDoesNotPromote) {
    SlotLru lru(2);
    ASSERT_TRUE(lru.acquire(key(1), 0, false).is_ok());
    ASSERT_TRUE(lru.acquire(key(2), 0, false).is_ok());

    EXPECT_EQ(lru.find(key(1)), 0u);
    EXPECT_EQ(lru.least_recent(), 0u);
}

TEST(SlotLruTest, ResidentSlotsAreUnique) {
    SlotLru lru(8);
    for (u32 i = 0; i < 100; ++i) {
        ASSERT_TRUE(lru.acquire(key(static_cast<text::GlyphIndex>(i)), 0, false).is_ok());
        if (i % 3 == 0) {
            (void)lru.touch(key(static_cast<text::GlyphIndex>(i / 2)), 0);
        }
    }

    auto order = lru.recency_order();
    std::set<u32> unique(order.begin(), order.end());
    EXPECT_EQ(order.size(), 8u);
    EXPECT_EQ(unique.size(), 8u);
    for (u32 slot : order) {
        auto resident = lru.key_at(slot);
        ASSERT_TRUE(resident.has_value());
        EXPECT_EQ(lru.find(*resident), slot);
    }
}

TEST(SlotLruTest, ProtectedBatchRefusesEviction) {
    SlotLru lru(2);
    ASSERT_TRUE(lru.acquire(key(1), 5, true).is_ok());
    ASSERT_TRUE(lru.acquire(key(2), 5, true).is_ok());

    auto refused = lru.acquire(key(3), 5, true);
    ASSERT_TRUE(refused.is_err());
    EXPECT_EQ(refused.error(), CacheError::TierExhausted);
    EXPECT_EQ(lru.find(key(1)), 0u);

    auto next_batch = lru.acquire(key(3), 6, true);
    ASSERT_TRUE(next_batch.is_ok());
    EXPECT_EQ(*next_batch.value().evicted, key(1));
}

TEST(SlotLruTest, UnprotectedAcquireAlwaysEvicts) {
    SlotLru lru(1);
    ASSERT_TRUE(lru.acquire(key(1), 5, false).is_ok());
    EXPECT_TRUE(lru.acquire(key(2), 5, false).is_ok());
}

TEST(SlotLruTest, ZeroCapacityIsInvalid) {
    SlotLru lru(0);
    auto acquired = lru.acquire(key(1), 0, false);
    ASSERT_TRUE(acquired.is_err());
    EXPECT_EQ(acquired.error(), CacheError::InvalidConfig);
}

TEST(SlotLruTest, ClearForgetsEverything) {
    SlotLru lru(2);
    ASSERT_TRUE(lru.acquire(key(1), 0, false).is_ok());
    lru.clear();

    EXPECT_EQ(lru.size(), 0u);
    EXPECT_FALSE(lru.find(key(1)).has_value());
    EXPECT_FALSE(lru.least_recent().has_value());
    EXPECT_EQ(lru.acquire(key(2), 0, false).value().slot, 0u);
}
