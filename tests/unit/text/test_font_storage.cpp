#include <gtest/gtest.h>
#include "petalite/text/font_storage.hpp"
#include "petalite/text/freetype_font.hpp"
#include "../../support/fake_font.hpp"
#include <set>
#include <thread>

using namespace petalite;
using namespace petalite::text;
using petalite::test::FakeFont;

// ============================================================================
// Registration
// ============================================================================

TEST(FontStorageTest, IdsAreNonZeroAndUnique) {
    FontStorage storage;
    FontId a = storage.add_font(std::make_shared<FakeFont>("Alpha"));
    FontId b = storage.add_font(std::make_shared<FakeFont>("Beta"));

    EXPECT_NE(a, INVALID_FONT_ID);
    EXPECT_NE(b, INVALID_FONT_ID);
    EXPECT_NE(a, b);
    EXPECT_EQ(storage.len(), 2u);
    EXPECT_EQ(storage.ids(), (std::vector<FontId>{a, b}));
}

TEST(FontStorageTest, NullFontIsRejected) {
    FontStorage storage;
    EXPECT_EQ(storage.add_font(nullptr), INVALID_FONT_ID);
    EXPECT_TRUE(storage.is_empty());
}

TEST(FontStorageTest, RemovedIdIsNeverReissued) {
    FontStorage storage;
    FontId a = storage.add_font(std::make_shared<FakeFont>());

    EXPECT_TRUE(storage.remove_face(a));
    EXPECT_FALSE(storage.remove_face(a));
    EXPECT_EQ(storage.font(a), nullptr);

    FontId b = storage.add_font(std::make_shared<FakeFont>());
    EXPECT_NE(a, b);
}

TEST(FontStorageTest, RemovedFontStaysAliveForHolders) {
    FontStorage storage;
    FontId id = storage.add_font(std::make_shared<FakeFont>("Held"));
    auto held = storage.font(id);

    ASSERT_TRUE(storage.remove_face(id));
    ASSERT_NE(held, nullptr);
    EXPECT_EQ(held->family(), "Held");
}

// ============================================================================
// Queries
// ============================================================================

TEST(FontStorageTest, QueryIsCaseInsensitive) {
    FontStorage storage;
    FontId id = storage.add_font(std::make_shared<FakeFont>("DejaVu Sans"));

    EXPECT_EQ(storage.query("dejavu sans"), id);
    EXPECT_EQ(storage.query("DEJAVU SANS"), id);
    EXPECT_FALSE(storage.query("DejaVu").has_value());
}

TEST(FontStorageTest, QueryPrefersLowestId) {
    FontStorage storage;
    FontId first = storage.add_font(std::make_shared<FakeFont>("Same"));
    storage.add_font(std::make_shared<FakeFont>("Same"));

    EXPECT_EQ(storage.query("Same"), first);
}

TEST(FontStorageTest, GenericFamiliesResolve) {
    FontStorage storage;
    FontId arial = storage.add_font(std::make_shared<FakeFont>("Arial"));
    FontId mono = storage.add_font(std::make_shared<FakeFont>("Fira Mono"));

    EXPECT_EQ(storage.generic_family(GenericFamily::SansSerif), "Arial");
    EXPECT_EQ(storage.query("sans-serif"), arial);
    EXPECT_FALSE(storage.query("monospace").has_value());

    storage.set_generic_family(GenericFamily::Monospace, "Fira Mono");
    EXPECT_EQ(storage.query("Monospace"), mono);
}

// ============================================================================
// FreeType loading
// ============================================================================

TEST(FontStorageTest, MissingFileIsNotFound) {
    FontStorage storage;
    auto result = storage.load_font_file("/nonexistent/petalite-missing.ttf");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), FontError::NotFound);
    EXPECT_TRUE(storage.is_empty());
}

TEST(FontStorageTest, GarbageDataIsInvalid) {
    FontStorage storage;
    auto result = storage.load_font_memory(std::vector<u8>(256, 0x5A));

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), FontError::InvalidData);
}

TEST(FreeTypeFontTest, EmptyDataIsInvalid) {
    auto result = FreeTypeFont::load_memory({});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), FontError::InvalidData);
}

TEST(FontErrorTest, Names) {
    EXPECT_STREQ(to_string(FontError::NotFound), "NotFound");
    EXPECT_STREQ(to_string(FontError::RasterizationFailed), "RasterizationFailed");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(FontStorageTest, ConcurrentRegistrationAndLookup) {
    FontStorage storage;
    FontId shared = storage.add_font(std::make_shared<FakeFont>("Shared"));

    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 50;
    std::vector<std::vector<FontId>> issued(THREADS);
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&storage, &issued, shared, t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                issued[t].push_back(storage.add_font(std::make_shared<FakeFont>("Worker")));
                auto font = storage.font(shared);
                EXPECT_NE(font, nullptr);
                EXPECT_EQ(storage.query("shared"), shared);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::set<FontId> unique;
    for (const auto& ids : issued) {
        unique.insert(ids.begin(), ids.end());
    }
    EXPECT_EQ(unique.size(), static_cast<usize>(THREADS * PER_THREAD));
    EXPECT_EQ(unique.count(shared), 0u);
    EXPECT_EQ(storage.len(), static_cast<usize>(THREADS * PER_THREAD + 1));
}
