#include "text_provider.h"
#include "../utils/logging.h"

FallbackTextProvider::FallbackTextProvider(std::unique_ptr<TextProvider> primary,
                                           std::unique_ptr<TextProvider> fallback)
    : primary_(std::move(primary)), fallback_(std::move(fallback)) {}

TextGenerationResult FallbackTextProvider::generate(const std::string& highlight, int min_lines, int max_lines) {
    TextGenerationResult result = primary_->generate(highlight, min_lines, max_lines);
    if (result.success()) {
        return result;
    }

    LOG_WARN(primary_->name() << " text generation failed (" << result.message
             << "), falling back to " << fallback_->name() << " text");
    fallback_count_++;
    return fallback_->generate(highlight, min_lines, max_lines);
}
