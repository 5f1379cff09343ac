#include <gtest/gtest.h>

#include "test_helpers.h"
#include "text/font_catalog.h"
#include <algorithm>
#include <filesystem>

namespace {

bool contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

}  // namespace

TEST(FontCatalogTest, BoldCandidatesFromRegularName) {
    auto candidates = boldVariantCandidates("/fonts/Roboto-Regular.ttf");
    EXPECT_TRUE(contains(candidates, "/fonts/Roboto-Bold.ttf"));
    EXPECT_TRUE(contains(candidates, "/fonts/Roboto-Regular-Bold.ttf"));
    EXPECT_FALSE(contains(candidates, "/fonts/Roboto-Regular.ttf"));
    EXPECT_EQ(candidates.front(), "/fonts/Roboto-Bold.ttf");
}

TEST(FontCatalogTest, BoldCandidatesForWindowsStyleNames) {
    auto candidates = boldVariantCandidates("/fonts/arial.ttf");
    EXPECT_TRUE(contains(candidates, "/fonts/arialbd.ttf"));
    EXPECT_TRUE(contains(candidates, "/fonts/arial-Bold.ttf"));
    EXPECT_TRUE(contains(candidates, "/fonts/arialb.ttf"));
}

TEST(FontCatalogTest, RecognizesFontExtensions) {
    EXPECT_TRUE(isFontFileName("a/B.TTF"));
    EXPECT_TRUE(isFontFileName("x.otf"));
    EXPECT_FALSE(isFontFileName("x.woff"));
    EXPECT_FALSE(isFontFileName("README"));
}

TEST(FontCatalogTest, DiscoversOnlyFontFiles) {
    const std::string dir = makeTempDir("font_discover");
    writeFile(dir + "/one.ttf", "not really a font");
    writeFile(dir + "/two.OTF", "not really a font");
    writeFile(dir + "/notes.txt", "ignored");

    FontCatalog catalog(false);
    EXPECT_EQ(catalog.discover(dir), 2u);
    EXPECT_EQ(catalog.available().count(dir + "/one.ttf"), 1u);
}

TEST(FontCatalogTest, EmptyDirectoryWithoutFallbackHasNoFonts) {
    const std::string dir = makeTempDir("font_empty");
    FontCatalog catalog(false);
    EXPECT_EQ(catalog.discover(dir), 0u);
    RandomSource rng(1);
    EXPECT_FALSE(catalog.select({}, rng).has_value());
}

TEST(FontCatalogTest, SelectSkipsExcludedFonts) {
    const std::string dir = makeTempDir("font_select");
    writeFile(dir + "/a.ttf", "x");
    writeFile(dir + "/b.ttf", "x");
    FontCatalog catalog(false);
    catalog.discover(dir);

    RandomSource rng(4);
    std::set<std::string> excluded = {dir + "/a.ttf"};
    for (int i = 0; i < 20; i++) {
        auto path = catalog.select(excluded, rng);
        ASSERT_TRUE(path.has_value());
        EXPECT_EQ(*path, dir + "/b.ttf");
    }
    excluded.insert(dir + "/b.ttf");
    EXPECT_FALSE(catalog.select(excluded, rng).has_value());
}

TEST(FontCatalogTest, PinnedFontWinsWhenPresent) {
    const std::string dir = makeTempDir("font_pinned");
    writeFile(dir + "/a.ttf", "x");
    writeFile(dir + "/b.ttf", "x");
    FontCatalog catalog(false);
    catalog.discover(dir);

    RandomSource rng(8);
    for (int i = 0; i < 10; i++) {
        EXPECT_EQ(*catalog.selectPreferring(dir, "b.ttf", {}, rng), dir + "/b.ttf");
    }
    // Missing pinned font falls back to random selection
    auto path = catalog.selectPreferring(dir, "gone.ttf", {}, rng);
    ASSERT_TRUE(path.has_value());
    EXPECT_TRUE(*path == dir + "/a.ttf" || *path == dir + "/b.ttf");
}

TEST(FontCatalogTest, GarbageFileFailsToLoad) {
    const std::string dir = makeTempDir("font_garbage");
    writeFile(dir + "/broken.ttf", "this is not a TrueType file");
    FontCatalog catalog(false);

    FontLoadResult result = catalog.loadForSize(dir + "/broken.ttf", 24.0f);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.error, ErrorKind::FontLoad);
    EXPECT_NE(result.message.find("broken.ttf"), std::string::npos);

    EXPECT_EQ(catalog.loadForSize(dir + "/missing.ttf", 24.0f).error, ErrorKind::FontLoad);
    EXPECT_EQ(catalog.cachedFontCount(), 0u);
}

TEST(FontCatalogTest, RepeatedLoadsReuseTheTypeface) {
    const std::string path = findUsableTestFont();
    if (path.empty()) {
        GTEST_SKIP() << "no usable system font";
    }
    FontCatalog catalog;
    FontLoadResult first = catalog.loadForSize(path, 28.0f);
    FontLoadResult second = catalog.loadForSize(path, 28.0f);
    ASSERT_TRUE(first.success()) << first.message;
    ASSERT_TRUE(second.success()) << second.message;
    EXPECT_EQ(first.font.regularFont().getTypeface(), second.font.regularFont().getTypeface());
    EXPECT_EQ(first.font.boldPath(), second.font.boldPath());
    EXPECT_EQ(catalog.cachedFontCount(), 1u);

    FontLoadResult other_size = catalog.loadForSize(path, 40.0f);
    ASSERT_TRUE(other_size.success());
    EXPECT_FLOAT_EQ(other_size.font.size(), 40.0f);
    EXPECT_EQ(catalog.cachedFontCount(), 2u);
}

TEST(FontCatalogTest, LoadsSystemFontWithMetrics) {
    const std::string path = findUsableTestFont();
    if (path.empty()) {
        GTEST_SKIP() << "no usable system font";
    }
    FontCatalog catalog;
    FontLoadResult result = catalog.loadForSize(path, 32.0f);
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_TRUE(result.font.valid());
    EXPECT_FLOAT_EQ(result.font.size(), 32.0f);
    EXPECT_GT(result.font.metrics().ascent, 0.0f);
    EXPECT_GT(result.font.metrics().height(), 0.0f);

    EXPECT_EQ(catalog.loadForSize(path, 0.0f).error, ErrorKind::FontLoad);
    EXPECT_EQ(catalog.loadForSize(path, 5000.0f).error, ErrorKind::FontLoad);
}
