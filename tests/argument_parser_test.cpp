#include <gtest/gtest.h>

#include "core/argument_parser.h"
#include <string>
#include <vector>

namespace {

int parse(std::vector<std::string> words, Arguments& args) {
    words.insert(words.begin(), "matchcut");
    std::vector<char*> argv;
    for (auto& word : words) {
        argv.push_back(&word[0]);
    }
    argv.push_back(nullptr);
    return parseArguments(static_cast<int>(words.size()), argv.data(), args);
}

}  // namespace

TEST(ArgumentParserTest, HelpReturnsTwo) {
    Arguments args;
    EXPECT_EQ(parse({"--help"}, args), 2);
    Arguments short_args;
    EXPECT_EQ(parse({"--width", "512", "-h"}, short_args), 2);
}

TEST(ArgumentParserTest, RejectsBadInput) {
    Arguments a;
    EXPECT_EQ(parse({"--frobnicate", "1"}, a), 1);
    Arguments b;
    EXPECT_EQ(parse({"--width", "12px"}, b), 1);
    Arguments c;
    EXPECT_EQ(parse({"--width"}, c), 1);
    Arguments d;
    EXPECT_EQ(parse({"--blur", "motion"}, d), 1);
    Arguments e;
    EXPECT_EQ(parse({"--seed", "-4"}, e), 1);
    Arguments f;
    EXPECT_EQ(parse({"--text-color", "#12"}, f), 1);
    Arguments g;
    EXPECT_EQ(parse({"one.mp4", "two.mp4"}, g), 1);
}

TEST(ArgumentParserTest, ParsesOptionsAndOutput) {
    Arguments args;
    ASSERT_EQ(parse({"--highlight", "Better Gaming", "--width", "640", "--blur", "radial",
                     "--highlight-color", "#ff8800", "--seed", "1234", "--no-system-fonts",
                     "--quiet", "out/video.mp4"}, args), 0);
    EXPECT_EQ(args.output_path, "out/video.mp4");
    EXPECT_EQ(*args.highlight, "Better Gaming");
    EXPECT_EQ(*args.width, 640);
    EXPECT_FALSE(args.height.has_value());
    EXPECT_EQ(*args.blur_mode, BlurMode::Radial);
    EXPECT_EQ(args.highlight_color->r, 0xff);
    EXPECT_EQ(args.highlight_color->g, 0x88);
    EXPECT_EQ(args.highlight_color->b, 0x00);
    EXPECT_EQ(*args.seed, 1234u);
    EXPECT_FALSE(*args.system_font_fallback);
    EXPECT_TRUE(args.quiet_mode);
}

TEST(ArgumentParserTest, OnlyGivenArgumentsOverrideConfig) {
    RunConfig config;
    config.frame.width = 800;
    config.frame.height = 600;
    config.pool_size = 4;
    config.output_path = "from-file.mp4";

    Arguments args;
    ASSERT_EQ(parse({"--height", "720", "--seed", "99", "--preset", "fast"}, args), 0);
    applyArguments(args, config);

    EXPECT_EQ(config.frame.width, 800);
    EXPECT_EQ(config.frame.height, 720);
    EXPECT_EQ(config.pool_size, 4);
    EXPECT_EQ(config.output_path, "from-file.mp4");
    EXPECT_EQ(config.frame.seed, 99u);
    EXPECT_TRUE(config.seed_set);
    EXPECT_EQ(config.encoder_preset, "fast");
}
