#include "snippet_pool.h"
#include "../utils/logging.h"
#include <stdexcept>

SnippetPool::SnippetPool(TextProvider& provider,
                         const std::string& highlight,
                         int min_lines,
                         int max_lines,
                         int pool_size,
                         int frames_per_snippet)
    : provider_(provider),
      highlight_(highlight),
      min_lines_(min_lines),
      max_lines_(max_lines),
      pool_size_(static_cast<size_t>(pool_size)),
      frames_per_snippet_(frames_per_snippet) {}

bool SnippetPool::grow(std::string& errorMsg) {
    TextGenerationResult result = provider_.generate(highlight_, min_lines_, max_lines_);
    if (!result.success()) {
        errorMsg = result.message;
        return false;
    }
    result.snippet.id = next_id_++;
    LOG_DEBUG("Snippet " << result.snippet.id << " created with " << result.snippet.lines.size()
              << " lines, highlight on line " << result.snippet.highlight_line_index);
    snippets_.push_back(std::move(result.snippet));
    return true;
}

bool SnippetPool::tick(std::string& errorMsg) {
    if (snippets_.empty() || counter_ >= frames_per_snippet_) {
        if (snippets_.size() < pool_size_) {
            std::string growError;
            if (!grow(growError)) {
                if (snippets_.empty()) {
                    errorMsg = "no valid text content: " + growError;
                    return false;
                }
                LOG_WARN("Could not add a snippet (" << growError << "), reusing the "
                         << snippets_.size() << " already in the pool");
            }
        }
        cursor_ = (cursor_ + 1) % snippets_.size();
        counter_ = 0;
    }
    counter_++;
    return true;
}

const TextSnippet& SnippetPool::current() const {
    if (snippets_.empty()) {
        throw std::logic_error("SnippetPool::current called before the first tick");
    }
    return snippets_[cursor_];
}
