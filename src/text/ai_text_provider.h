#ifndef AI_TEXT_PROVIDER_H
#define AI_TEXT_PROVIDER_H

#include "text_provider.h"
#include <memory>
#include <string>
#include <vector>

// Transport to an external text-generation service
class TextGenerationClient {
public:
    virtual ~TextGenerationClient() = default;

    // Send prompt, store the raw completion in response.
    // Returns false and fills errorMsg when the service could not be reached.
    virtual bool complete(const std::string& prompt, std::string& response, std::string& errorMsg) = 0;
};

// Runs a shell command with the prompt on stdin and reads the completion from stdout
class CommandTextClient : public TextGenerationClient {
public:
    explicit CommandTextClient(const std::string& command);

    bool complete(const std::string& prompt, std::string& response, std::string& errorMsg) override;

private:
    std::string command_;
};

std::string buildTextPrompt(const std::string& highlight, int target_lines, int min_chars, int max_chars);

// Strip markdown fences, bold markers, headings, bullets, Note:/Format: lines
// and leading "N. " numbering. Empty lines are dropped.
std::vector<std::string> cleanAiResponse(const std::string& content);

// Keep only lines that look like real sentences inside the character band,
// pick the first line holding the phrase as the highlight line, drop later
// lines that repeat the phrase and trim to max_lines.
bool selectSnippetLines(const std::vector<std::string>& lines,
                        const std::string& highlight,
                        const TextBounds& bounds,
                        TextSnippet& snippet,
                        std::string& errorMsg);

class AiTextProvider : public TextProvider {
public:
    AiTextProvider(std::unique_ptr<TextGenerationClient> client, int min_chars, int max_chars, int attempts);

    TextGenerationResult generate(const std::string& highlight, int min_lines, int max_lines) override;
    const char* name() const override { return "ai"; }

private:
    std::unique_ptr<TextGenerationClient> client_;
    int min_chars_;
    int max_chars_;
    int attempts_;
};

#endif // AI_TEXT_PROVIDER_H
