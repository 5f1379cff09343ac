#ifndef SNIPPET_POOL_H
#define SNIPPET_POOL_H

#include "text_provider.h"
#include <string>
#include <vector>

// Bounded rotating cache of snippets. Each snippet is shown for
// frames_per_snippet consecutive frames; while the pool is below pool_size a
// rotation first asks the provider for a fresh snippet.
class SnippetPool {
public:
    SnippetPool(TextProvider& provider,
                const std::string& highlight,
                int min_lines,
                int max_lines,
                int pool_size,
                int frames_per_snippet);

    // Called once before each frame. Fails only when the pool is still empty
    // and the provider could not supply a snippet.
    bool tick(std::string& errorMsg);

    const TextSnippet& current() const;

    size_t size() const { return snippets_.size(); }
    int created() const { return next_id_; }

private:
    bool grow(std::string& errorMsg);

    TextProvider& provider_;
    std::string highlight_;
    int min_lines_;
    int max_lines_;
    size_t pool_size_;
    int frames_per_snippet_;

    std::vector<TextSnippet> snippets_;
    size_t cursor_ = 0;
    int counter_ = 0;
    int next_id_ = 0;
};

#endif // SNIPPET_POOL_H
