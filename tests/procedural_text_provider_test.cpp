#include <gtest/gtest.h>

#include "text/procedural_text_provider.h"
#include "utils/string_utils.h"
#include <cctype>

namespace {

void expectSnippetInvariants(const TextSnippet& snippet, const std::string& highlight,
                             int min_lines, int max_lines, int min_chars, int max_chars) {
    const int count = static_cast<int>(snippet.lines.size());
    EXPECT_GE(count, min_lines);
    EXPECT_LE(count, max_lines);
    ASSERT_GE(snippet.highlight_line_index, 0);
    ASSERT_LT(snippet.highlight_line_index, count);

    int lines_with_phrase = 0;
    for (int i = 0; i < count; i++) {
        const std::string& line = snippet.lines[static_cast<size_t>(i)];
        EXPECT_GE(static_cast<int>(line.size()), min_chars) << line;
        EXPECT_LE(static_cast<int>(line.size()), max_chars) << line;
        if (line.find(highlight) != std::string::npos) {
            lines_with_phrase++;
            EXPECT_EQ(i, snippet.highlight_line_index);
        }
    }
    EXPECT_EQ(lines_with_phrase, 1);
}

}  // namespace

TEST(ProceduralTextProviderTest, BetterGamingExperienceAcrossSeeds) {
    const std::string highlight = "Better Gaming Experience";
    for (uint64_t seed = 1; seed <= 200; seed++) {
        RandomSource rng(seed);
        ProceduralTextProvider provider(rng, 50, 80);
        TextGenerationResult result = provider.generate(highlight, 7, 12);
        ASSERT_TRUE(result.success()) << result.message;
        expectSnippetInvariants(result.snippet, highlight, 7, 12, 50, 80);
    }
}

TEST(ProceduralTextProviderTest, SingleWordPhrasesThatHideInsideOtherWords) {
    // "time" appears inside "sometimes", "the" inside "other" and "their"
    for (const std::string highlight : {"time", "the", "good", "is"}) {
        for (uint64_t seed = 1; seed <= 50; seed++) {
            RandomSource rng(seed);
            ProceduralTextProvider provider(rng, 50, 80);
            TextGenerationResult result = provider.generate(highlight, 10, 12);
            ASSERT_TRUE(result.success()) << result.message;
            expectSnippetInvariants(result.snippet, highlight, 10, 12, 50, 80);
        }
    }
}

TEST(ProceduralTextProviderTest, RespectsCustomCharacterBand) {
    RandomSource rng(9);
    ProceduralTextProvider provider(rng, 30, 44);
    for (int i = 0; i < 30; i++) {
        TextGenerationResult result = provider.generate("launch day", 3, 5);
        ASSERT_TRUE(result.success()) << result.message;
        expectSnippetInvariants(result.snippet, "launch day", 3, 5, 30, 44);
    }
}

TEST(ProceduralTextProviderTest, LongPhraseStillFits) {
    const std::string highlight = "an unusually long highlighted phrase here";
    for (uint64_t seed = 1; seed <= 50; seed++) {
        RandomSource rng(seed);
        ProceduralTextProvider provider(rng, 50, 80);
        TextGenerationResult result = provider.generate(highlight, 7, 12);
        ASSERT_TRUE(result.success()) << result.message;
        expectSnippetInvariants(result.snippet, highlight, 7, 12, 50, 80);
    }
}

TEST(ProceduralTextProviderTest, SameSeedSameText) {
    RandomSource a(31);
    RandomSource b(31);
    ProceduralTextProvider pa(a, 50, 80);
    ProceduralTextProvider pb(b, 50, 80);
    TextGenerationResult ra = pa.generate("hello there", 7, 12);
    TextGenerationResult rb = pb.generate("hello there", 7, 12);
    EXPECT_EQ(ra.snippet.lines, rb.snippet.lines);
    EXPECT_EQ(ra.snippet.highlight_line_index, rb.snippet.highlight_line_index);
}

TEST(ProceduralTextProviderTest, LinesEndWithPunctuationAndStartCapitalized) {
    RandomSource rng(5);
    ProceduralTextProvider provider(rng, 50, 80);
    for (int i = 0; i < 50; i++) {
        std::string line = provider.buildLine("zebra");
        EXPECT_TRUE(hasTerminalPunctuation(line)) << line;
        EXPECT_FALSE(std::islower(static_cast<unsigned char>(line[0]))) << line;
        EXPECT_EQ(line.find("zebra"), std::string::npos);
    }
}

TEST(ProceduralTextProviderTest, HighlightLineKeepsPhraseVerbatim) {
    RandomSource rng(11);
    ProceduralTextProvider provider(rng, 50, 80);
    for (int i = 0; i < 50; i++) {
        std::string line = provider.buildHighlightLine("new feature");
        EXPECT_NE(line.find("new feature"), std::string::npos) << line;
        EXPECT_GE(line.size(), 50u);
        EXPECT_LE(line.size(), 80u);
    }
}

TEST(ProceduralTextProviderTest, EmptyPhraseIsADefect) {
    RandomSource rng(1);
    ProceduralTextProvider provider(rng, 50, 80);
    EXPECT_THROW(provider.generate("", 7, 12), std::logic_error);
}
