#include "text_snippet.h"

bool validateSnippet(const TextSnippet& snippet,
                     const std::string& highlight,
                     const TextBounds& bounds,
                     std::string& errorMsg) {
    const int count = static_cast<int>(snippet.lines.size());
    if (count < bounds.min_lines || count > bounds.max_lines) {
        errorMsg = "snippet has " + std::to_string(count) + " lines, expected " +
                   std::to_string(bounds.min_lines) + ".." + std::to_string(bounds.max_lines);
        return false;
    }
    if (snippet.highlight_line_index < 0 || snippet.highlight_line_index >= count) {
        errorMsg = "highlight line index " + std::to_string(snippet.highlight_line_index) + " out of range";
        return false;
    }

    for (int i = 0; i < count; i++) {
        const std::string& line = snippet.lines[static_cast<size_t>(i)];
        const int length = static_cast<int>(line.size());
        if (length < bounds.min_chars || length > bounds.max_chars) {
            errorMsg = "line " + std::to_string(i) + " has " + std::to_string(length) +
                       " characters, expected " + std::to_string(bounds.min_chars) + ".." +
                       std::to_string(bounds.max_chars) + ": \"" + line + "\"";
            return false;
        }
        const bool contains = line.find(highlight) != std::string::npos;
        if (i == snippet.highlight_line_index && !contains) {
            errorMsg = "highlight line " + std::to_string(i) + " does not contain \"" + highlight + "\"";
            return false;
        }
        if (i != snippet.highlight_line_index && contains) {
            errorMsg = "line " + std::to_string(i) + " also contains \"" + highlight + "\"";
            return false;
        }
    }
    return true;
}
