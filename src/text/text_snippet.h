#ifndef TEXT_SNIPPET_H
#define TEXT_SNIPPET_H

#include "../core/run_config.h"
#include <string>
#include <vector>

// One multi-line block of text plus the index of the line holding the highlight phrase
struct TextSnippet {
    std::vector<std::string> lines;
    int highlight_line_index = -1;
    int id = -1;  // creation order within a pool

    const std::string& highlightLine() const { return lines.at(static_cast<size_t>(highlight_line_index)); }
};

// Check every snippet invariant: index in range, the phrase on exactly that
// line and no other, line lengths within [min_chars, max_chars], line count
// within [min_lines, max_lines].
bool validateSnippet(const TextSnippet& snippet,
                     const std::string& highlight,
                     const TextBounds& bounds,
                     std::string& errorMsg);

#endif // TEXT_SNIPPET_H
