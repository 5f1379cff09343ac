#ifndef TEXT_PROVIDER_H
#define TEXT_PROVIDER_H

#include "text_snippet.h"
#include "../core/errors.h"
#include <memory>
#include <string>

struct TextGenerationResult {
    TextSnippet snippet;
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool success() const { return error == ErrorKind::None; }

    static TextGenerationResult failure(const std::string& msg) {
        TextGenerationResult result;
        result.error = ErrorKind::TextGeneration;
        result.message = msg;
        return result;
    }
};

// Source of text snippets. Implementations are selected once at setup.
class TextProvider {
public:
    virtual ~TextProvider() = default;

    // Produce one snippet whose line count lies in [min_lines, max_lines] and
    // whose highlight line contains highlight verbatim.
    virtual TextGenerationResult generate(const std::string& highlight, int min_lines, int max_lines) = 0;

    virtual const char* name() const = 0;
};

// Tries primary first; when it fails, asks fallback
class FallbackTextProvider : public TextProvider {
public:
    FallbackTextProvider(std::unique_ptr<TextProvider> primary, std::unique_ptr<TextProvider> fallback);

    TextGenerationResult generate(const std::string& highlight, int min_lines, int max_lines) override;
    const char* name() const override { return "fallback"; }

    int fallbackCount() const { return fallback_count_; }

private:
    std::unique_ptr<TextProvider> primary_;
    std::unique_ptr<TextProvider> fallback_;
    int fallback_count_ = 0;
};

#endif // TEXT_PROVIDER_H
