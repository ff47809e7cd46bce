#include <gtest/gtest.h>
#include "petalite/layout/layout_engine.hpp"
#include "petalite/render/cpu_renderer.hpp"
#include "petalite/text/font_storage.hpp"
#include "../../support/fake_font.hpp"

using namespace petalite;
using namespace petalite::render;
using petalite::test::FakeFont;

namespace {

class CpuRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        font = std::make_shared<FakeFont>();
        font_id = fonts.add_font(font);
    }

    layout::LayoutResult<Color> lay_out(const std::string& text, f32 size = 16.0f) {
        layout::TextData<Color> data;
        data.append(text, font_id, size, Color::red());
        return layout::LayoutEngine(fonts).layout(data, {});
    }

    std::unique_ptr<cache::CpuGlyphCache> make_cache(std::vector<cache::CpuTierConfig> tiers) {
        return cache::CpuGlyphCache::create(std::move(tiers), fonts).value();
    }

    text::FontStorage fonts;
    std::shared_ptr<FakeFont> font;
    text::FontId font_id{0};
};

} // anonymous namespace

TEST_F(CpuRendererTest, CoverageLandsInGlyphBounds) {
    auto cache = make_cache({{1024, 16}});
    CpuRenderer renderer(*cache);
    CoverageBitmap bitmap(40, 20);

    auto stats = renderer.render_coverage(lay_out("ab"), bitmap);

    EXPECT_EQ(stats.drawn, 2u);
    EXPECT_EQ(stats.culled, 0u);
    // 'a' covers x 1..8 and y 1..12, 'b' starts at x 11
    EXPECT_EQ(bitmap.at(0, 0), 0);
    EXPECT_EQ(bitmap.at(1, 1), 255);
    EXPECT_EQ(bitmap.at(8, 12), 255);
    EXPECT_EQ(bitmap.at(9, 1), 0);
    EXPECT_EQ(bitmap.at(8, 13), 0);
    EXPECT_EQ(bitmap.at(11, 1), 255);
}

TEST_F(CpuRendererTest, SinkSeesPayloadAndStaysInsideExtent) {
    auto cache = make_cache({{1024, 16}});
    CpuRenderer renderer(*cache);

    u32 calls = 0;
    bool outside = false;
    RectI extent(0, 0, 5, 5);
    auto stats = renderer.render(lay_out("a"), extent, [&](PointI p, u8 coverage, const Color& color) {
        ++calls;
        outside = outside || !extent.contains(p);
        EXPECT_EQ(coverage, 255);
        EXPECT_EQ(color, Color::red());
    });

    EXPECT_EQ(stats.drawn, 1u);
    EXPECT_FALSE(outside);
    EXPECT_EQ(calls, 16u);
}

TEST_F(CpuRendererTest, GlyphsOutsideExtentAreCulledBeforeRasterizing) {
    auto cache = make_cache({{1024, 16}});
    CpuRenderer renderer(*cache);
    CoverageBitmap bitmap(20, 16);

    auto stats = renderer.render_coverage(lay_out("a\nb\nc"), bitmap);

    EXPECT_EQ(stats.drawn, 1u);
    EXPECT_EQ(stats.culled, 2u);
    EXPECT_EQ(font->rasterize_calls(), 1u);
}

TEST_F(CpuRendererTest, UnresolvableGlyphsAreCountedAndSkipped) {
    auto cache = make_cache({{64, 4}});
    CpuRenderer renderer(*cache);
    CoverageBitmap bitmap(40, 20);

    auto stats = renderer.render_coverage(lay_out("ab"), bitmap);

    EXPECT_EQ(stats.failed, 2u);
    EXPECT_EQ(stats.drawn, 0u);
    EXPECT_EQ(bitmap.at(1, 1), 0);
}

TEST_F(CpuRendererTest, SmallCacheStillRendersEveryGlyph) {
    auto cache = make_cache({{1024, 1}});
    CpuRenderer renderer(*cache);
    CoverageBitmap bitmap(60, 20);

    auto stats = renderer.render_coverage(lay_out("abcde"), bitmap);

    EXPECT_EQ(stats.drawn, 5u);
    for (u32 i = 0; i < 5; ++i) {
        EXPECT_EQ(bitmap.at(1 + i * 10, 5), 255) << "glyph " << i;
    }
}

TEST(CoverageBitmapTest, AccumulateSaturates) {
    CoverageBitmap bitmap(2, 2);
    bitmap.accumulate(1, 1, 200);
    bitmap.accumulate(1, 1, 100);

    EXPECT_EQ(bitmap.at(1, 1), 255);
    EXPECT_EQ(bitmap.at(0, 0), 0);
    EXPECT_EQ(bitmap.extent(), RectI(0, 0, 2, 2));
}
