#ifndef ARGUMENT_PARSER_H
#define ARGUMENT_PARSER_H

#include "run_config.h"
#include <cstdint>
#include <optional>
#include <string>

// Command-line arguments. Unset optionals keep the value from the config
// file (or the built-in default).
struct Arguments {
    bool debug_mode = false;
    bool quiet_mode = false;
    bool show_version = false;
    std::string config_file;
    std::string output_path;

    std::optional<std::string> highlight;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> fps;
    std::optional<int> duration;
    std::optional<int> density;
    std::optional<float> font_size_ratio;
    std::optional<float> vertical_spread;
    std::optional<RgbColor> highlight_color;
    std::optional<RgbColor> text_color;
    std::optional<RgbColor> background_color;
    std::optional<BlurMode> blur_mode;
    std::optional<float> blur_radius;
    std::optional<std::string> texture;
    std::optional<std::string> media_dir;
    std::optional<std::string> font_dir;
    std::optional<std::string> selected_font;
    std::optional<bool> system_font_fallback;
    std::optional<int> min_lines;
    std::optional<int> max_lines;
    std::optional<int> frames_per_snippet;
    std::optional<int> pool_size;
    std::optional<uint64_t> seed;
    std::optional<std::string> ai_command;
    std::optional<std::string> ffmpeg_path;
    std::optional<std::string> preset;
};

// Parse command-line arguments
// Returns 0 on success, 1 on error (and prints error message), 2 when help was shown
int parseArguments(int argc, char* argv[], Arguments& args);

// Copy every argument that was given into config
void applyArguments(const Arguments& args, RunConfig& config);

// Print usage/help message
void printUsage(const char* program_name);

#endif // ARGUMENT_PARSER_H
