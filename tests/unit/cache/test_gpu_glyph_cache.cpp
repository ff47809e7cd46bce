#include <gtest/gtest.h>
#include "petalite/cache/gpu_glyph_cache.hpp"
#include "petalite/text/font_storage.hpp"
#include "../../support/fake_font.hpp"
#include <set>

using namespace petalite;
using namespace petalite::cache;
using petalite::test::FakeFont;

namespace {

class GpuGlyphCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        font = std::make_shared<FakeFont>();
        font_id = fonts.add_font(font);
    }

    text::GlyphKey key(text::GlyphIndex glyph, f32 size = 16.0f) const {
        text::GlyphKey k;
        k.font = font_id;
        k.glyph = glyph;
        k.size_q = text::GlyphKey::quantize_size(size);
        return k;
    }

    std::unique_ptr<GpuGlyphCache> make_cache(std::vector<GpuTierConfig> tiers) {
        auto created = GpuGlyphCache::create(std::move(tiers), fonts);
        EXPECT_TRUE(created.is_ok());
        return created.is_ok() ? std::move(created).value() : nullptr;
    }

    text::FontStorage fonts;
    std::shared_ptr<FakeFont> font;
    text::FontId font_id{0};
};

} // anonymous namespace

TEST_F(GpuGlyphCacheTest, InvalidConfigurations) {
    EXPECT_EQ(GpuGlyphCache::create({}, fonts).error(), CacheError::InvalidConfig);
    EXPECT_EQ(GpuGlyphCache::create({{64, 16, 512, 1}}, fonts).error(), CacheError::InvalidConfig);
    EXPECT_EQ(GpuGlyphCache::create({{32, 16, 512, 0}}, fonts).error(), CacheError::InvalidConfig);
}

TEST_F(GpuGlyphCacheTest, TilesAreLaidOutRowMajor) {
    auto cache = make_cache({{32, 16, 512, 2}});
    ASSERT_NE(cache, nullptr);

    GpuGlyphView first;
    GpuGlyphView eighteenth;
    for (u32 i = 0; i < 18; ++i) {
        auto view = cache->resolve(key(static_cast<text::GlyphIndex>(0x100 + i))).value();
        if (i == 0) first = view;
        if (i == 17) eighteenth = view;
    }

    EXPECT_EQ(first.x, 0u);
    EXPECT_EQ(first.y, 0u);
    EXPECT_EQ(first.layer, 0u);
    EXPECT_EQ(eighteenth.slot, 17u);
    EXPECT_EQ(eighteenth.x, 32u);
    EXPECT_EQ(eighteenth.y, 32u);
    EXPECT_FLOAT_EQ(eighteenth.uv.x, 32.0f / 512.0f);
    EXPECT_FLOAT_EQ(eighteenth.uv.width, 8.0f / 512.0f);
    EXPECT_FLOAT_EQ(eighteenth.uv.height, 12.0f / 512.0f);
}

TEST_F(GpuGlyphCacheTest, FullPageSpillsToNextLayer) {
    auto cache = make_cache({{32, 16, 512, 2}});

    std::set<u32> layers;
    for (u32 i = 0; i < 300; ++i) {
        auto view = cache->resolve(key(static_cast<text::GlyphIndex>(0x100 + i)));
        ASSERT_TRUE(view.is_ok());
        layers.insert(view.value().layer);
    }

    EXPECT_EQ(cache->page_count(0), 2u);
    EXPECT_EQ(layers, (std::set<u32>{0, 1}));
    EXPECT_EQ(cache->stats().evictions, 0u);
}

TEST_F(GpuGlyphCacheTest, MissesQueueUploads) {
    auto cache = make_cache({{32, 16, 512, 1}});

    auto a = cache->resolve(key('a')).value();
    ASSERT_TRUE(cache->resolve(key('b')).is_ok());
    ASSERT_TRUE(cache->resolve(key('a')).is_ok());
    ASSERT_TRUE(cache->resolve(key(' ')).is_ok());

    ASSERT_TRUE(cache->has_pending_uploads());
    auto uploads = cache->take_uploads();
    ASSERT_EQ(uploads.size(), 2u);
    EXPECT_FALSE(cache->has_pending_uploads());

    const AtlasUpload& up = uploads[0];
    EXPECT_EQ(up.atlas, a.atlas);
    EXPECT_EQ(up.layer, a.layer);
    EXPECT_EQ(up.x, a.x);
    EXPECT_EQ(up.width, 8u);
    EXPECT_EQ(up.height, 12u);
    EXPECT_EQ(up.coverage.size(), 8u * 12u);
}

TEST_F(GpuGlyphCacheTest, CurrentBatchIsProtected) {
    auto cache = make_cache({{32, 1, 32, 1}});

    ASSERT_TRUE(cache->resolve(key('a')).is_ok());
    auto refused = cache->resolve(key('b'));
    ASSERT_TRUE(refused.is_err());
    EXPECT_EQ(refused.error(), CacheError::TierExhausted);
    EXPECT_TRUE(cache->contains(key('a')));

    cache->begin_batch();
    ASSERT_TRUE(cache->resolve(key('b')).is_ok());
    EXPECT_FALSE(cache->contains(key('a')));
    EXPECT_EQ(cache->stats().evictions, 1u);
}

TEST_F(GpuGlyphCacheTest, HitRefreshesProtection) {
    auto cache = make_cache({{32, 1, 32, 2}});

    ASSERT_TRUE(cache->resolve(key('a')).is_ok());
    ASSERT_TRUE(cache->resolve(key('b')).is_ok());
    cache->begin_batch();

    // 'a' is used again in the new batch, so 'b' is the only victim
    ASSERT_TRUE(cache->resolve(key('a')).is_ok());
    ASSERT_TRUE(cache->resolve(key('c')).is_ok());
    EXPECT_TRUE(cache->contains(key('a')));
    EXPECT_FALSE(cache->contains(key('b')));
    EXPECT_EQ(cache->resolve(key('d')).error(), CacheError::TierExhausted);
}

TEST_F(GpuGlyphCacheTest, OversizedGlyphRasterizesUncached) {
    auto cache = make_cache({{32, 16, 512, 1}});

    auto result = cache->resolve(key('a', 64.0f));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), CacheError::OversizedGlyph);

    auto bitmap = cache->rasterize_uncached(key('a', 64.0f));
    ASSERT_TRUE(bitmap.is_ok());
    EXPECT_EQ(bitmap.value().metrics.width, 32u);
    EXPECT_EQ(bitmap.value().metrics.height, 48u);
    EXPECT_FALSE(cache->contains(key('a', 64.0f)));
}

TEST_F(GpuGlyphCacheTest, AtlasDescriptorsFollowTiers) {
    auto cache = make_cache({{64, 8, 512, 2}, {16, 32, 512, 3}});
    auto atlases = cache->atlases();

    ASSERT_EQ(atlases.size(), 2u);
    EXPECT_EQ(atlases[0].atlas, 0u);
    EXPECT_EQ(atlases[0].tile_size, 16u);
    EXPECT_EQ(atlases[0].layers, 3u);
    EXPECT_EQ(atlases[1].tile_size, 64u);
    EXPECT_EQ(atlases[1].texture_size, 512u);
}

TEST_F(GpuGlyphCacheTest, ClearDropsPendingUploads) {
    auto cache = make_cache({{32, 16, 512, 1}});
    ASSERT_TRUE(cache->resolve(key('a')).is_ok());

    cache->clear();
    EXPECT_FALSE(cache->has_pending_uploads());
    EXPECT_FALSE(cache->contains(key('a')));
    EXPECT_EQ(cache->page_count(0), 0u);
}
