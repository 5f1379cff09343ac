#include <gtest/gtest.h>

#include "core/video_generator.h"
#include "test_helpers.h"
#include <filesystem>

namespace {

RunConfig makeRunConfig(const std::string& dir) {
    RunConfig config;
    config.frame = testFrameSpec();
    config.frame.width = 256;
    config.frame.height = 256;
    config.frame.font_size = 14;
    config.frame.duration_seconds = 5;
    config.text.min_lines = 7;
    config.text.max_lines = 9;
    config.highlight_text = "Better Gaming";
    config.output_path = dir + "/out.mp4";
    config.system_font_fallback = false;
    return config;
}

// Pin the run to one installed font so every frame uses it
bool pinUsableFont(RunConfig& config) {
    const std::string path = findUsableTestFont();
    if (path.empty()) {
        return false;
    }
    std::filesystem::path p(path);
    config.font_dir = p.parent_path().string();
    config.selected_font = p.filename().string();
    return true;
}

}  // namespace

TEST(VideoGeneratorTest, FiftyFramesUseTenDistinctSnippets) {
    RunConfig config = makeRunConfig(makeTempDir("generator_pool"));
    if (!pinUsableFont(config)) {
        GTEST_SKIP() << "no usable system font";
    }

    FontCatalog catalog(false);
    catalog.discover(config.font_dir);
    FakeTextProvider provider;
    VideoGenerator generator(config, catalog, provider);

    std::vector<EncodedFrame> frames;
    GenerationResult result = generator.renderFrames(frames);
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(result.frames_requested, 50);
    EXPECT_EQ(result.frames_rendered, 50);
    EXPECT_EQ(result.distinct_snippets, 10);
    EXPECT_EQ(provider.calls(), 10);
    ASSERT_EQ(frames.size(), 50u);
    for (size_t i = 0; i < frames.size(); i++) {
        EXPECT_EQ(frames[i].frame_index, static_cast<int>(i));
        EXPECT_TRUE(frames[i].has_png);
    }
    EXPECT_TRUE(result.failed_fonts.empty());
    // The pinned font is opened once and reused for every frame
    EXPECT_EQ(catalog.cachedFontCount(), 1u);
}

TEST(VideoGeneratorTest, TextFailureStopsTheRun) {
    RunConfig config = makeRunConfig(makeTempDir("generator_text"));
    if (!pinUsableFont(config)) {
        GTEST_SKIP() << "no usable system font";
    }

    FontCatalog catalog(false);
    catalog.discover(config.font_dir);
    FakeTextProvider provider(0);
    VideoGenerator generator(config, catalog, provider);

    std::vector<EncodedFrame> frames;
    GenerationResult result = generator.renderFrames(frames);
    EXPECT_EQ(result.error, ErrorKind::TextGeneration);
    EXPECT_NE(result.message.find("no valid text content"), std::string::npos);
    EXPECT_TRUE(frames.empty());
}

TEST(VideoGeneratorTest, UnloadableFontsExhaustTheRun) {
    const std::string dir = makeTempDir("generator_fonts");
    const std::string font_dir = dir + "/fonts";
    std::filesystem::create_directories(font_dir);
    writeFile(font_dir + "/first.ttf", "garbage");
    writeFile(font_dir + "/second.otf", "more garbage");

    RunConfig config = makeRunConfig(dir);
    config.font_dir = font_dir;
    config.ffmpeg_path = "false";

    GenerationResult result = generateVideo(config);
    EXPECT_EQ(result.error, ErrorKind::FontExhaustion);
    EXPECT_EQ(result.frames_rendered, 0);
    EXPECT_EQ(result.failed_fonts.size(), 2u);
    EXPECT_FALSE(std::filesystem::exists(config.output_path));
}

TEST(VideoGeneratorTest, RunEncodesEveryRenderedFrame) {
    const std::string dir = makeTempDir("generator_run");
    RunConfig config = makeRunConfig(dir);
    if (!pinUsableFont(config)) {
        GTEST_SKIP() << "no usable system font";
    }
    config.frame.duration_seconds = 1;
    config.output_path = dir + "/videos/result.mp4";
    config.ffmpeg_path = dir + "/fake-ffmpeg";
    writeFile(config.ffmpeg_path, "#!/bin/sh\nfor arg; do out=\"$arg\"; done\ncat > \"$out\"\n");
    std::filesystem::permissions(config.ffmpeg_path, std::filesystem::perms::owner_all);

    FontCatalog catalog(false);
    catalog.discover(config.font_dir);
    FakeTextProvider provider;
    GenerationResult result = VideoGenerator(config, catalog, provider).run();
    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(result.frames_encoded, 10);
    EXPECT_FALSE(result.short_video);
    EXPECT_TRUE(std::filesystem::exists(config.output_path));
    EXPECT_GT(std::filesystem::file_size(config.output_path), 0u);
}
