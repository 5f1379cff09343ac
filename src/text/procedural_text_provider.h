#ifndef PROCEDURAL_TEXT_PROVIDER_H
#define PROCEDURAL_TEXT_PROVIDER_H

#include "text_provider.h"
#include "../utils/random_source.h"
#include <string>

// Template-grammar filler text. Never fails: a snippet that breaks its own
// invariants is a defect and throws std::logic_error.
class ProceduralTextProvider : public TextProvider {
public:
    ProceduralTextProvider(RandomSource& rng, int min_chars, int max_chars);

    TextGenerationResult generate(const std::string& highlight, int min_lines, int max_lines) override;
    const char* name() const override { return "procedural"; }

    // A line that does not contain avoid
    std::string buildLine(const std::string& avoid);

    // A line that contains highlight verbatim
    std::string buildHighlightLine(const std::string& highlight);

private:
    RandomSource& rng_;
    int min_chars_;
    int max_chars_;

    // Replace {slot} placeholders with words. {phrase} becomes `phrase`; the
    // first occurrence of special_slot becomes special_word. Words that would
    // make the text contain avoid are skipped. Returns "" when no choice works.
    std::string fillTemplate(const std::string& structure,
                             const std::string& avoid,
                             const std::string& phrase,
                             const std::string& special_slot,
                             const std::string& special_word);

    // Pad with stock clauses / cut at word boundaries until the length lies in
    // [min_chars, max_chars]. Text before protected_end is never cut.
    // Returns "" when the band cannot be reached.
    std::string fitToBand(const std::string& line, size_t protected_end, const std::string& avoid);

    // Last-resort constructions that always land inside the band
    std::string buildFillerLine(const std::string& lead, const std::string& avoid);
};

#endif // PROCEDURAL_TEXT_PROVIDER_H
