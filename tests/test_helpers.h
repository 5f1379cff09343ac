#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include "core/run_config.h"
#include "text/text_provider.h"
#include "text/text_snippet.h"
#include <string>
#include <vector>

// Fresh empty directory under /tmp, unique per process and name
std::string makeTempDir(const std::string& name);

void writeFile(const std::string& path, const std::string& content);

// Path of an installed font that loads, or "" when the host has none
std::string findUsableTestFont();

// 512x512 frame with a fixed seed and finalized sizes
FrameSpec testFrameSpec();

// A valid snippet of `count` lines (50-80 chars) with the phrase on highlight_index
TextSnippet makeSnippet(const std::string& highlight, int count, int highlight_index);

// Returns canned snippets; fails once `fail_after` successful calls were made
class FakeTextProvider : public TextProvider {
public:
    explicit FakeTextProvider(int fail_after = -1) : fail_after_(fail_after) {}

    TextGenerationResult generate(const std::string& highlight, int min_lines, int max_lines) override;
    const char* name() const override { return "fake"; }

    int calls() const { return calls_; }

private:
    int fail_after_;
    int calls_ = 0;
    int successes_ = 0;
};

#endif // TEST_HELPERS_H
