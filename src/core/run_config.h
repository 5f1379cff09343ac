#ifndef RUN_CONFIG_H
#define RUN_CONFIG_H

#include <cstdint>
#include <string>

struct RgbColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const RgbColor& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

enum class BlurMode {
    None,
    Gaussian,
    Radial
};

// Visual parameters of every frame. Immutable for the whole run.
struct FrameSpec {
    int width = 1024;
    int height = 1024;
    int fps = 10;
    int duration_seconds = 5;

    float font_size_ratio = 0.0f;   // 0 = take from density preset
    int font_size = 0;              // derived: height * font_size_ratio

    RgbColor highlight_color{255, 255, 0};
    RgbColor text_color{0, 0, 0};
    RgbColor background_color{255, 255, 255};

    BlurMode blur_mode = BlurMode::Gaussian;
    float blur_radius = 4.0f;
    float radial_sharp_radius_factor = 0.3f;  // fraction of min(W,H) kept sharp

    float vertical_spread = 0.0f;   // 0 = take from density preset

    std::string background_texture = "none";
    std::string media_dir = "media";

    float jitter_min = -5.0f;
    float jitter_max = 5.0f;

    float noise_intensity = 0.08f;
    int grain_size = 2;
    float vignette_intensity = 0.3f;

    uint64_t seed = 0;

    int totalFrames() const { return fps * duration_seconds; }
};

// Line-count and line-length bounds every snippet must satisfy
struct TextBounds {
    int min_lines = 0;   // 0 = take from density preset
    int max_lines = 0;   // 0 = take from density preset
    int min_chars = 50;
    int max_chars = 80;
};

struct RunConfig {
    FrameSpec frame;
    TextBounds text;

    std::string highlight_text;
    int density = 2;               // 1 = low, 2 = medium, 3 = high

    int frames_per_snippet = 3;
    int pool_size = 10;
    int max_font_retries = 5;

    std::string font_dir = "fonts";
    std::string selected_font = "random";
    bool system_font_fallback = true;

    std::string ai_command;        // empty = procedural text only
    int ai_attempts = 3;

    std::string output_path;
    std::string ffmpeg_path = "ffmpeg";
    std::string encoder_preset = "medium";

    bool seed_set = false;
};

// Parse "#RRGGBB", "#RGB" or a basic color name. Returns false on malformed input.
bool parseColor(const std::string& text, RgbColor& out);

// Parse "none" / "gaussian" / "radial" (case-insensitive)
bool parseBlurMode(const std::string& text, BlurMode& out);
const char* blurModeName(BlurMode mode);

// Load a JSON run-config file into config. Keys absent from the file keep
// their current values. Returns false and fills errorMsg on failure.
bool loadRunConfigFile(const std::string& configPath, RunConfig& config, std::string& errorMsg);

// Fill preset-driven fields (lines, spread, font size ratio) left at 0 and
// derive the font size and seed.
void finalizeRunConfig(RunConfig& config);

// Validate bounds of a finalized config. The output path is checked by the caller.
bool validateRunConfig(const RunConfig& config, std::string& errorMsg);

#endif // RUN_CONFIG_H
