#include <gtest/gtest.h>
#include "petalite/cache/cpu_glyph_cache.hpp"
#include "petalite/text/font_storage.hpp"
#include "../../support/fake_font.hpp"

using namespace petalite;
using namespace petalite::cache;
using petalite::test::FakeFont;

namespace {

class CpuGlyphCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        font = std::make_shared<FakeFont>();
        font->set_failing('!');
        font_id = fonts.add_font(font);
    }

    text::GlyphKey key(text::GlyphIndex glyph, f32 size = 16.0f, u8 bucket = 0) const {
        text::GlyphKey k;
        k.font = font_id;
        k.glyph = glyph;
        k.size_q = text::GlyphKey::quantize_size(size);
        k.subpixel_positions = 4;
        k.subpixel_bucket = bucket;
        return k;
    }

    std::unique_ptr<CpuGlyphCache> make_cache(std::vector<CpuTierConfig> tiers) {
        auto created = CpuGlyphCache::create(std::move(tiers), fonts);
        EXPECT_TRUE(created.is_ok());
        return created.is_ok() ? std::move(created).value() : nullptr;
    }

    text::FontStorage fonts;
    std::shared_ptr<FakeFont> font;
    text::FontId font_id{0};
};

} // anonymous namespace

TEST_F(CpuGlyphCacheTest, InvalidConfigurations) {
    EXPECT_EQ(CpuGlyphCache::create({}, fonts).error(), CacheError::InvalidConfig);
    EXPECT_EQ(CpuGlyphCache::create({{0, 4}}, fonts).error(), CacheError::InvalidConfig);
    EXPECT_EQ(CpuGlyphCache::create({{1024, 0}}, fonts).error(), CacheError::InvalidConfig);
}

TEST_F(CpuGlyphCacheTest, SecondResolveIsAHit) {
    auto cache = make_cache({{1024, 4}});
    ASSERT_NE(cache, nullptr);

    auto first = cache->resolve(key('a'));
    auto second = cache->resolve(key('a'));
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());

    EXPECT_EQ(first.value().slot, second.value().slot);
    EXPECT_EQ(first.value().coverage, second.value().coverage);
    EXPECT_EQ(font->rasterize_calls(), 1u);
    EXPECT_EQ(cache->stats().hits, 1u);
    EXPECT_EQ(cache->stats().misses, 1u);
}

TEST_F(CpuGlyphCacheTest, ViewCarriesBitmap) {
    auto cache = make_cache({{1024, 4}});
    auto view = cache->resolve(key('a')).value();

    EXPECT_EQ(view.width, 8u);
    EXPECT_EQ(view.height, 12u);
    EXPECT_EQ(view.xmin, 1);
    EXPECT_EQ(view.ymin, 0);
    EXPECT_EQ(view.top(), -12);
    EXPECT_EQ(view.coverage[0], 255);
    EXPECT_EQ(view.coverage[8 * 12 - 1], 255);
}

TEST_F(CpuGlyphCacheTest, EvictsLeastRecentlyUsedGlyph) {
    auto cache = make_cache({{1024, 2}});

    ASSERT_TRUE(cache->resolve(key('a')).is_ok());
    ASSERT_TRUE(cache->resolve(key('b')).is_ok());
    ASSERT_TRUE(cache->resolve(key('c')).is_ok());

    EXPECT_FALSE(cache->contains(key('a')));
    EXPECT_TRUE(cache->contains(key('b')));
    EXPECT_TRUE(cache->contains(key('c')));
    EXPECT_EQ(cache->stats().evictions, 1u);

    // Evicted glyphs are rasterized again on demand
    ASSERT_TRUE(cache->resolve(key('a')).is_ok());
    EXPECT_EQ(font->rasterize_calls(), 4u);
    EXPECT_FALSE(cache->contains(key('b')));
}

TEST_F(CpuGlyphCacheTest, RecentUseProtectsFromEviction) {
    auto cache = make_cache({{1024, 2}});

    ASSERT_TRUE(cache->resolve(key('a')).is_ok());
    ASSERT_TRUE(cache->resolve(key('b')).is_ok());
    ASSERT_TRUE(cache->resolve(key('a')).is_ok());
    ASSERT_TRUE(cache->resolve(key('c')).is_ok());

    EXPECT_TRUE(cache->contains(key('a')));
    EXPECT_FALSE(cache->contains(key('b')));
}

TEST_F(CpuGlyphCacheTest, SmallestFittingTierIsChosen) {
    // Given out of order; tiers are sorted by block size
    auto cache = make_cache({{4096, 2}, {128, 2}});

    auto small = cache->resolve(key('a', 16.0f)).value();
    auto large = cache->resolve(key('a', 48.0f)).value();

    EXPECT_EQ(cache->core().tier_config(0).block_size, 128u);
    EXPECT_EQ(small.tier, 0u);
    EXPECT_EQ(large.tier, 1u);
    EXPECT_EQ(large.width * large.height, 24u * 36u);
}

TEST_F(CpuGlyphCacheTest, OversizedGlyphIsRejected) {
    auto cache = make_cache({{64, 4}});
    auto result = cache->resolve(key('a'));

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), CacheError::OversizedGlyph);
    EXPECT_EQ(cache->stats().oversized, 1u);
    EXPECT_EQ(font->rasterize_calls(), 0u);
}

TEST_F(CpuGlyphCacheTest, MissingFontIsReported) {
    auto cache = make_cache({{1024, 4}});
    text::GlyphKey unknown = key('a');
    unknown.font = 999;

    auto result = cache->resolve(unknown);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), CacheError::MissingFont);
}

TEST_F(CpuGlyphCacheTest, BlankGlyphResolvesEmpty) {
    auto cache = make_cache({{1024, 4}});
    auto result = cache->resolve(key(' '));

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().is_empty());
}

TEST_F(CpuGlyphCacheTest, RasterFailureResolvesEmpty) {
    auto cache = make_cache({{1024, 4}});
    auto result = cache->resolve(key('!'));

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().is_empty());
    EXPECT_EQ(cache->stats().raster_failures, 1u);
}

TEST_F(CpuGlyphCacheTest, SubpixelBucketsAreDistinctEntries) {
    auto cache = make_cache({{1024, 4}});

    auto whole = cache->resolve(key('a', 16.0f, 0)).value();
    auto shifted = cache->resolve(key('a', 16.0f, 2)).value();

    EXPECT_NE(whole.slot, shifted.slot);
    EXPECT_EQ(whole.width, 8u);
    EXPECT_EQ(shifted.width, 9u);
}

TEST_F(CpuGlyphCacheTest, ClearEmptiesEveryTier) {
    auto cache = make_cache({{1024, 4}, {4096, 4}});
    ASSERT_TRUE(cache->resolve(key('a')).is_ok());
    ASSERT_TRUE(cache->resolve(key('a', 48.0f)).is_ok());

    cache->clear();
    EXPECT_FALSE(cache->contains(key('a')));
    EXPECT_FALSE(cache->contains(key('a', 48.0f)));
}
