#include "run_config.h"
#include "../utils/logging.h"
#include "../utils/random_source.h"
#include "../utils/string_utils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void readInt(const nlohmann::json& j, const char* key, int& out) {
    if (j.contains(key) && j[key].is_number()) {
        out = j[key].get<int>();
    }
}

void readFloat(const nlohmann::json& j, const char* key, float& out) {
    if (j.contains(key) && j[key].is_number()) {
        out = j[key].get<float>();
    }
}

void readString(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) {
        out = j[key].get<std::string>();
    }
}

bool readColor(const nlohmann::json& j, const char* key, RgbColor& out, std::string& errorMsg) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string() || !parseColor(j[key].get<std::string>(), out)) {
        errorMsg = std::string("Invalid color for '") + key + "'";
        return false;
    }
    return true;
}

struct DensityPreset {
    int min_lines;
    int max_lines;
    float vertical_spread;
    float font_size_ratio;
};

DensityPreset densityPreset(int density) {
    switch (density) {
        case 1:  return {10, 12, 1.5f, 0.06f};  // fewer, larger lines
        case 3:  return {14, 20, 1.1f, 0.04f};  // more, smaller lines
        default: return {12, 16, 1.3f, 0.05f};
    }
}

}  // namespace

bool parseColor(const std::string& text, RgbColor& out) {
    static const std::map<std::string, RgbColor> named = {
        {"white",  {255, 255, 255}},
        {"black",  {0, 0, 0}},
        {"yellow", {255, 255, 0}},
        {"red",    {255, 0, 0}},
        {"green",  {0, 128, 0}},
        {"blue",   {0, 0, 255}},
        {"gray",   {128, 128, 128}},
        {"grey",   {128, 128, 128}},
    };

    std::string value = toLower(trim(text));
    auto it = named.find(value);
    if (it != named.end()) {
        out = it->second;
        return true;
    }

    if (value.empty() || value[0] != '#') return false;
    std::string hex = value.substr(1);
    if (hex.size() == 3) {
        hex = {hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
    }
    if (hex.size() != 6) return false;

    int channels[3];
    for (int i = 0; i < 3; i++) {
        int hi = hexValue(hex[i * 2]);
        int lo = hexValue(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return false;
        channels[i] = hi * 16 + lo;
    }
    out.r = static_cast<uint8_t>(channels[0]);
    out.g = static_cast<uint8_t>(channels[1]);
    out.b = static_cast<uint8_t>(channels[2]);
    return true;
}

bool parseBlurMode(const std::string& text, BlurMode& out) {
    std::string value = toLower(trim(text));
    if (value == "none") {
        out = BlurMode::None;
    } else if (value == "gaussian") {
        out = BlurMode::Gaussian;
    } else if (value == "radial") {
        out = BlurMode::Radial;
    } else {
        return false;
    }
    return true;
}

const char* blurModeName(BlurMode mode) {
    switch (mode) {
        case BlurMode::None:     return "none";
        case BlurMode::Gaussian: return "gaussian";
        case BlurMode::Radial:   return "radial";
    }
    return "unknown";
}

bool loadRunConfigFile(const std::string& configPath, RunConfig& config, std::string& errorMsg) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        errorMsg = "Could not open config file: " + configPath;
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;
        file.close();

        if (!j.is_object()) {
            errorMsg = "Config root must be a JSON object: " + configPath;
            return false;
        }

        FrameSpec& frame = config.frame;
        readInt(j, "width", frame.width);
        readInt(j, "height", frame.height);
        readInt(j, "fps", frame.fps);
        readInt(j, "duration", frame.duration_seconds);
        readFloat(j, "fontSizeRatio", frame.font_size_ratio);
        readFloat(j, "verticalSpread", frame.vertical_spread);
        readString(j, "highlight", config.highlight_text);
        readInt(j, "density", config.density);

        if (j.contains("colors") && j["colors"].is_object()) {
            const auto& colors = j["colors"];
            if (!readColor(colors, "highlight", frame.highlight_color, errorMsg) ||
                !readColor(colors, "text", frame.text_color, errorMsg) ||
                !readColor(colors, "background", frame.background_color, errorMsg)) {
                return false;
            }
        }

        if (j.contains("blur") && j["blur"].is_object()) {
            const auto& blur = j["blur"];
            if (blur.contains("mode")) {
                if (!blur["mode"].is_string() || !parseBlurMode(blur["mode"].get<std::string>(), frame.blur_mode)) {
                    errorMsg = "blur.mode must be one of none, gaussian, radial";
                    return false;
                }
            }
            readFloat(blur, "radius", frame.blur_radius);
            readFloat(blur, "sharpRadiusFactor", frame.radial_sharp_radius_factor);
        }

        if (j.contains("texture") && j["texture"].is_object()) {
            readString(j["texture"], "name", frame.background_texture);
            readString(j["texture"], "mediaDir", frame.media_dir);
            readFloat(j["texture"], "noiseIntensity", frame.noise_intensity);
            readInt(j["texture"], "grainSize", frame.grain_size);
            readFloat(j["texture"], "vignette", frame.vignette_intensity);
        }

        if (j.contains("jitter") && j["jitter"].is_number()) {
            float amplitude = j["jitter"].get<float>();
            frame.jitter_min = -amplitude;
            frame.jitter_max = amplitude;
        }

        if (j.contains("lines") && j["lines"].is_object()) {
            const auto& lines = j["lines"];
            readInt(lines, "min", config.text.min_lines);
            readInt(lines, "max", config.text.max_lines);
            readInt(lines, "minChars", config.text.min_chars);
            readInt(lines, "maxChars", config.text.max_chars);
        }

        if (j.contains("pool") && j["pool"].is_object()) {
            readInt(j["pool"], "size", config.pool_size);
            readInt(j["pool"], "framesPerSnippet", config.frames_per_snippet);
        }

        if (j.contains("fonts") && j["fonts"].is_object()) {
            const auto& fonts = j["fonts"];
            readString(fonts, "dir", config.font_dir);
            readString(fonts, "selected", config.selected_font);
            readInt(fonts, "maxRetries", config.max_font_retries);
            if (fonts.contains("systemFallback") && fonts["systemFallback"].is_boolean()) {
                config.system_font_fallback = fonts["systemFallback"].get<bool>();
            }
        }

        if (j.contains("ai") && j["ai"].is_object()) {
            readString(j["ai"], "command", config.ai_command);
            readInt(j["ai"], "attempts", config.ai_attempts);
        }

        if (j.contains("ffmpeg") && j["ffmpeg"].is_object()) {
            readString(j["ffmpeg"], "path", config.ffmpeg_path);
            readString(j["ffmpeg"], "preset", config.encoder_preset);
        }

        readString(j, "output", config.output_path);

        if (j.contains("seed") && j["seed"].is_number_unsigned()) {
            frame.seed = j["seed"].get<uint64_t>();
            config.seed_set = true;
        }
    } catch (const nlohmann::json::exception& e) {
        errorMsg = "Failed to parse config file " + configPath + ": " + e.what();
        return false;
    }

    return true;
}

void finalizeRunConfig(RunConfig& config) {
    DensityPreset preset = densityPreset(config.density);

    if (config.text.min_lines <= 0) config.text.min_lines = preset.min_lines;
    if (config.text.max_lines <= 0) config.text.max_lines = std::max(preset.max_lines, config.text.min_lines);
    if (config.frame.vertical_spread <= 0.0f) config.frame.vertical_spread = preset.vertical_spread;
    if (config.frame.font_size_ratio <= 0.0f) config.frame.font_size_ratio = preset.font_size_ratio;

    config.frame.font_size = static_cast<int>(config.frame.height * config.frame.font_size_ratio);

    if (!config.seed_set) {
        config.frame.seed = makeTimeSeed();
        config.seed_set = true;
        LOG_DEBUG("No seed given, using " << config.frame.seed);
    }
}

bool validateRunConfig(const RunConfig& config, std::string& errorMsg) {
    const FrameSpec& frame = config.frame;

    if (frame.width < 256 || frame.width > 4096 || frame.height < 256 || frame.height > 4096) {
        errorMsg = "width and height must be between 256 and 4096 pixels (got " +
                   std::to_string(frame.width) + "x" + std::to_string(frame.height) + ")";
        return false;
    }
    if (frame.fps < 1 || frame.fps > 60) {
        errorMsg = "fps must be between 1 and 60 (got " + std::to_string(frame.fps) + ")";
        return false;
    }
    if (frame.duration_seconds < 1 || frame.duration_seconds > 60) {
        errorMsg = "duration must be between 1 and 60 seconds (got " + std::to_string(frame.duration_seconds) + ")";
        return false;
    }
    if (trim(config.highlight_text).empty()) {
        errorMsg = "highlight text cannot be empty";
        return false;
    }
    if (std::none_of(config.highlight_text.begin(), config.highlight_text.end(),
                     [](unsigned char c) { return std::isalnum(c) != 0; })) {
        errorMsg = "highlight text must contain at least one letter or digit";
        return false;
    }
    if (config.highlight_text.find('\n') != std::string::npos) {
        errorMsg = "highlight text must be a single line";
        return false;
    }
    if (frame.blur_radius < 0.0f) {
        errorMsg = "blur radius cannot be negative";
        return false;
    }
    if (frame.radial_sharp_radius_factor <= 0.0f || frame.radial_sharp_radius_factor > 1.0f) {
        errorMsg = "radial sharp radius factor must be in (0, 1]";
        return false;
    }
    if (frame.vertical_spread <= 0.0f || frame.vertical_spread > 5.0f) {
        errorMsg = "vertical spread must be in (0, 5]";
        return false;
    }
    if (frame.font_size < 1) {
        errorMsg = "font size ratio yields a font size below 1px";
        return false;
    }
    if (frame.jitter_min > frame.jitter_max) {
        errorMsg = "jitter bounds are inverted";
        return false;
    }
    if (frame.grain_size < 1) {
        errorMsg = "grain size must be at least 1";
        return false;
    }
    if (config.density < 1 || config.density > 3) {
        errorMsg = "density must be 1, 2 or 3";
        return false;
    }

    const TextBounds& text = config.text;
    if (text.min_lines < 1 || text.max_lines < text.min_lines) {
        errorMsg = "line bounds must satisfy 1 <= min <= max (got " +
                   std::to_string(text.min_lines) + ".." + std::to_string(text.max_lines) + ")";
        return false;
    }
    if (text.min_chars < 1 || text.min_chars + 12 > text.max_chars) {
        errorMsg = "line length bounds must satisfy minChars + 12 <= maxChars";
        return false;
    }
    if (static_cast<int>(config.highlight_text.size()) + 8 > text.max_chars) {
        errorMsg = "highlight text is too long for a " + std::to_string(text.max_chars) + "-character line";
        return false;
    }

    if (config.frames_per_snippet < 1) {
        errorMsg = "frames per snippet must be at least 1";
        return false;
    }
    if (config.pool_size < 1) {
        errorMsg = "pool size must be at least 1";
        return false;
    }
    if (config.max_font_retries < 1) {
        errorMsg = "max font retries must be at least 1";
        return false;
    }
    if (config.ai_attempts < 1) {
        errorMsg = "ai attempts must be at least 1";
        return false;
    }
    return true;
}
