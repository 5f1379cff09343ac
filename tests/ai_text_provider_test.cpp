#include <gtest/gtest.h>

#include "test_helpers.h"
#include "text/ai_text_provider.h"
#include "text/procedural_text_provider.h"
#include <algorithm>

namespace {

// Replays canned completions in order; the last one repeats
class ScriptedClient : public TextGenerationClient {
public:
    explicit ScriptedClient(std::vector<std::string> replies, int* calls)
        : replies_(std::move(replies)), calls_(calls) {}

    bool complete(const std::string& prompt, std::string& response, std::string& errorMsg) override {
        last_prompt = prompt;
        int index = std::min(*calls_, static_cast<int>(replies_.size()) - 1);
        (*calls_)++;
        if (replies_.empty() || replies_[static_cast<size_t>(index)] == "<offline>") {
            errorMsg = "service unreachable";
            return false;
        }
        response = replies_[static_cast<size_t>(index)];
        return true;
    }

    std::string last_prompt;

private:
    std::vector<std::string> replies_;
    int* calls_;
};

const char* kGoodReply =
    "```\n"
    "# Story\n"
    "1. The city woke slowly under a pale and patient winter sky today.\n"
    "2. Shop owners lifted their shutters and swept the icy sidewalks clean.\n"
    "3. Everyone was talking about the **Better Gaming Experience** launch.\n"
    "4. Children pressed their faces against the glass of the corner store.\n"
    "- a bullet that should vanish\n"
    "Note: this line is commentary\n"
    "5. By noon the line outside stretched all the way past the old bakery.\n"
    "6. A Better Gaming Experience banner hung over the door for everyone.\n"
    "7. Too short.\n"
    "8. Nobody seemed to mind the cold while they waited for their turn inside.\n"
    "```\n";

}  // namespace

TEST(AiTextProviderTest, CleanResponseStripsFormatting) {
    auto lines = cleanAiResponse(kGoodReply);
    ASSERT_EQ(lines.size(), 8u);
    EXPECT_EQ(lines[0], "The city woke slowly under a pale and patient winter sky today.");
    EXPECT_EQ(lines[2], "Everyone was talking about the Better Gaming Experience launch.");
    for (const auto& line : lines) {
        EXPECT_NE(line[0], '#');
        EXPECT_NE(line[0], '-');
        EXPECT_EQ(line.find("Note:"), std::string::npos);
        EXPECT_EQ(line.find("```"), std::string::npos);
    }
}

TEST(AiTextProviderTest, SelectKeepsFirstPhraseLineOnly) {
    TextBounds bounds;
    bounds.min_lines = 3;
    bounds.max_lines = 12;
    TextSnippet snippet;
    std::string errorMsg;
    ASSERT_TRUE(selectSnippetLines(cleanAiResponse(kGoodReply), "Better Gaming Experience", bounds, snippet, errorMsg))
        << errorMsg;

    // Drops the short line and the second line containing the phrase
    EXPECT_EQ(snippet.lines.size(), 6u);
    EXPECT_EQ(snippet.highlight_line_index, 2);
    EXPECT_TRUE(validateSnippet(snippet, "Better Gaming Experience", bounds, errorMsg)) << errorMsg;
}

TEST(AiTextProviderTest, SelectTrimsToMaxLinesKeepingHighlight) {
    std::vector<std::string> lines;
    for (int i = 0; i < 10; i++) {
        lines.push_back("Sentence number " + std::to_string(i) + " keeps the paragraph flowing onward nicely.");
    }
    lines.push_back("At the very end we finally reach the launch party downtown tonight.");

    TextBounds bounds;
    bounds.min_lines = 3;
    bounds.max_lines = 4;
    TextSnippet snippet;
    std::string errorMsg;
    ASSERT_TRUE(selectSnippetLines(lines, "launch party", bounds, snippet, errorMsg)) << errorMsg;
    ASSERT_EQ(snippet.lines.size(), 4u);
    EXPECT_EQ(snippet.highlight_line_index, 3);
    EXPECT_NE(snippet.highlightLine().find("launch party"), std::string::npos);
}

TEST(AiTextProviderTest, SelectFailsWithoutPhraseOrEnoughLines) {
    TextBounds bounds;
    bounds.min_lines = 7;
    bounds.max_lines = 12;
    TextSnippet snippet;
    std::string errorMsg;
    EXPECT_FALSE(selectSnippetLines(cleanAiResponse(kGoodReply), "missing phrase", bounds, snippet, errorMsg));
    EXPECT_FALSE(selectSnippetLines(cleanAiResponse(kGoodReply), "Better Gaming Experience", bounds, snippet, errorMsg));
}

TEST(AiTextProviderTest, PromptNamesPhraseAndBand) {
    std::string prompt = buildTextPrompt("Better Gaming Experience", 12, 50, 80);
    EXPECT_NE(prompt.find("exactly 12 lines"), std::string::npos);
    EXPECT_NE(prompt.find("'Better Gaming Experience'"), std::string::npos);
    EXPECT_NE(prompt.find("50-80 characters"), std::string::npos);
}

TEST(AiTextProviderTest, RetriesThenSucceeds) {
    int calls = 0;
    auto client = std::make_unique<ScriptedClient>(std::vector<std::string>{"<offline>", "no usable text", kGoodReply}, &calls);
    AiTextProvider provider(std::move(client), 50, 80, 3);
    TextGenerationResult result = provider.generate("Better Gaming Experience", 3, 12);
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(calls, 3);
}

TEST(AiTextProviderTest, GivesUpAfterConfiguredAttempts) {
    int calls = 0;
    auto client = std::make_unique<ScriptedClient>(std::vector<std::string>{"<offline>"}, &calls);
    AiTextProvider provider(std::move(client), 50, 80, 3);
    TextGenerationResult result = provider.generate("Better Gaming Experience", 7, 12);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.error, ErrorKind::TextGeneration);
    EXPECT_EQ(calls, 3);
}

TEST(AiTextProviderTest, FallbackUsesProceduralText) {
    int calls = 0;
    auto client = std::make_unique<ScriptedClient>(std::vector<std::string>{"<offline>"}, &calls);
    RandomSource rng(3);
    FallbackTextProvider provider(std::make_unique<AiTextProvider>(std::move(client), 50, 80, 3),
                                  std::make_unique<ProceduralTextProvider>(rng, 50, 80));
    TextGenerationResult result = provider.generate("Better Gaming Experience", 7, 12);
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(provider.fallbackCount(), 1);
    std::string errorMsg;
    TextBounds bounds;
    bounds.min_lines = 7;
    bounds.max_lines = 12;
    EXPECT_TRUE(validateSnippet(result.snippet, "Better Gaming Experience", bounds, errorMsg)) << errorMsg;
}

TEST(AiTextProviderTest, CommandClientPipesPromptThroughCommand) {
    CommandTextClient client("tr a-z A-Z");
    std::string response;
    std::string errorMsg;
    ASSERT_TRUE(client.complete("hello prompt", response, errorMsg)) << errorMsg;
    EXPECT_EQ(response, "HELLO PROMPT");

    CommandTextClient failing("exit 3");
    EXPECT_FALSE(failing.complete("ignored", response, errorMsg));
    EXPECT_NE(errorMsg.find("3"), std::string::npos);
}
