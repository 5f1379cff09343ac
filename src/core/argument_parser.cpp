#include "argument_parser.h"
#include "../utils/logging.h"
#include <stdexcept>
#include <string>

void printUsage(const char* program_name) {
    LOG_CERR("Usage: " << program_name << " [options] --highlight <text> <output.mp4>") << std::endl;
    LOG_CERR("  --config <file>             JSON run configuration (flags override it)") << std::endl;
    LOG_CERR("  --highlight <text>          Phrase shown sharp and boxed in the center") << std::endl;
    LOG_CERR("  --width <px>, --height <px> Frame size, 256-4096 (default: 1024x1024)") << std::endl;
    LOG_CERR("  --fps <n>                   Frames per second, 1-60 (default: 10)") << std::endl;
    LOG_CERR("  --duration <s>              Video length in seconds, 1-60 (default: 5)") << std::endl;
    LOG_CERR("  --density <1|2|3>           Text density preset: low, medium, high (default: 2)") << std::endl;
    LOG_CERR("  --font-size-ratio <f>       Font size as a fraction of the frame height") << std::endl;
    LOG_CERR("  --vertical-spread <f>       Line spacing factor, (0, 5]") << std::endl;
    LOG_CERR("  --highlight-color <color>   #RRGGBB, #RGB or a color name (default: yellow)") << std::endl;
    LOG_CERR("  --text-color <color>        (default: black)") << std::endl;
    LOG_CERR("  --background-color <color>  (default: white)") << std::endl;
    LOG_CERR("  --blur <none|gaussian|radial>  Background blur mode (default: gaussian)") << std::endl;
    LOG_CERR("  --blur-radius <px>          Blur radius (default: 4)") << std::endl;
    LOG_CERR("  --texture <name>            Background texture in the media directory (default: none)") << std::endl;
    LOG_CERR("  --media-dir <dir>           Texture directory (default: media)") << std::endl;
    LOG_CERR("  --font-dir <dir>            Font directory (default: fonts)") << std::endl;
    LOG_CERR("  --font <file>               Use this font from the font directory instead of a random one") << std::endl;
    LOG_CERR("  --no-system-fonts           Never fall back to installed system fonts") << std::endl;
    LOG_CERR("  --min-lines <n>, --max-lines <n>  Lines per text snippet") << std::endl;
    LOG_CERR("  --frames-per-snippet <n>    Consecutive frames showing one snippet (default: 3)") << std::endl;
    LOG_CERR("  --pool-size <n>             Distinct snippets per run (default: 10)") << std::endl;
    LOG_CERR("  --seed <n>                  Seed for a reproducible run") << std::endl;
    LOG_CERR("  --ai-command <cmd>          Command that reads a prompt on stdin and prints text") << std::endl;
    LOG_CERR("  --ffmpeg <path>             ffmpeg binary (default: ffmpeg)") << std::endl;
    LOG_CERR("  --preset <name>             x264 preset (default: medium)") << std::endl;
    LOG_CERR("  --quiet                     Only print warnings and errors") << std::endl;
    LOG_CERR("  --debug                     Enable debug output") << std::endl;
    LOG_CERR("  --version                   Print version and exit") << std::endl;
}

namespace {

bool parseIntValue(const std::string& option, const std::string& value, int& out) {
    size_t used = 0;
    try {
        out = std::stoi(value, &used);
    } catch (const std::exception& e) {
        LOG_CERR("Error: Invalid integer for " << option << ": " << value << " (" << e.what() << ")") << std::endl;
        return false;
    }
    if (used != value.size()) {
        LOG_CERR("Error: Invalid integer for " << option << ": " << value) << std::endl;
        return false;
    }
    return true;
}

bool parseFloatValue(const std::string& option, const std::string& value, float& out) {
    size_t used = 0;
    try {
        out = std::stof(value, &used);
    } catch (const std::exception& e) {
        LOG_CERR("Error: Invalid number for " << option << ": " << value << " (" << e.what() << ")") << std::endl;
        return false;
    }
    if (used != value.size()) {
        LOG_CERR("Error: Invalid number for " << option << ": " << value) << std::endl;
        return false;
    }
    return true;
}

bool parseSeedValue(const std::string& value, uint64_t& out) {
    size_t used = 0;
    try {
        out = std::stoull(value, &used);
    } catch (const std::exception& e) {
        LOG_CERR("Error: Invalid seed: " << value << " (" << e.what() << ")") << std::endl;
        return false;
    }
    if (used != value.size() || value[0] == '-') {
        LOG_CERR("Error: Invalid seed: " << value) << std::endl;
        return false;
    }
    return true;
}

bool parseColorValue(const std::string& option, const std::string& value, RgbColor& out) {
    if (parseColor(value, out)) return true;
    LOG_CERR("Error: Invalid color for " << option << ": " << value) << std::endl;
    return false;
}

}  // namespace

int parseArguments(int argc, char* argv[], Arguments& args) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 2;
        } else if (arg == "--debug") {
            args.debug_mode = true;
            continue;
        } else if (arg == "--quiet") {
            args.quiet_mode = true;
            continue;
        } else if (arg == "--version") {
            args.show_version = true;
            continue;
        } else if (arg == "--no-system-fonts") {
            args.system_font_fallback = false;
            continue;
        } else if (arg.size() < 2 || arg[0] != '-' || arg[1] != '-') {
            if (!args.output_path.empty()) {
                LOG_CERR("Error: Unexpected argument: " << arg) << std::endl;
                return 1;
            }
            args.output_path = arg;
            continue;
        }

        // Every remaining option takes a value
        if (i + 1 >= argc) {
            LOG_CERR("Error: " << arg << " requires a value") << std::endl;
            return 1;
        }
        const std::string value = argv[++i];
        int int_value = 0;
        float float_value = 0.0f;
        RgbColor color;

        if (arg == "--config") {
            args.config_file = value;
        } else if (arg == "--highlight") {
            args.highlight = value;
        } else if (arg == "--width") {
            if (!parseIntValue(arg, value, int_value)) return 1;
            args.width = int_value;
        } else if (arg == "--height") {
            if (!parseIntValue(arg, value, int_value)) return 1;
            args.height = int_value;
        } else if (arg == "--fps") {
            if (!parseIntValue(arg, value, int_value)) return 1;
            args.fps = int_value;
        } else if (arg == "--duration") {
            if (!parseIntValue(arg, value, int_value)) return 1;
            args.duration = int_value;
        } else if (arg == "--density") {
            if (!parseIntValue(arg, value, int_value)) return 1;
            args.density = int_value;
        } else if (arg == "--font-size-ratio") {
            if (!parseFloatValue(arg, value, float_value)) return 1;
            args.font_size_ratio = float_value;
        } else if (arg == "--vertical-spread") {
            if (!parseFloatValue(arg, value, float_value)) return 1;
            args.vertical_spread = float_value;
        } else if (arg == "--highlight-color") {
            if (!parseColorValue(arg, value, color)) return 1;
            args.highlight_color = color;
        } else if (arg == "--text-color") {
            if (!parseColorValue(arg, value, color)) return 1;
            args.text_color = color;
        } else if (arg == "--background-color") {
            if (!parseColorValue(arg, value, color)) return 1;
            args.background_color = color;
        } else if (arg == "--blur") {
            BlurMode mode;
            if (!parseBlurMode(value, mode)) {
                LOG_CERR("Error: Blur mode must be none, gaussian or radial: " << value) << std::endl;
                return 1;
            }
            args.blur_mode = mode;
        } else if (arg == "--blur-radius") {
            if (!parseFloatValue(arg, value, float_value)) return 1;
            args.blur_radius = float_value;
        } else if (arg == "--texture") {
            args.texture = value;
        } else if (arg == "--media-dir") {
            args.media_dir = value;
        } else if (arg == "--font-dir") {
            args.font_dir = value;
        } else if (arg == "--font") {
            args.selected_font = value;
        } else if (arg == "--min-lines") {
            if (!parseIntValue(arg, value, int_value)) return 1;
            args.min_lines = int_value;
        } else if (arg == "--max-lines") {
            if (!parseIntValue(arg, value, int_value)) return 1;
            args.max_lines = int_value;
        } else if (arg == "--frames-per-snippet") {
            if (!parseIntValue(arg, value, int_value)) return 1;
            args.frames_per_snippet = int_value;
        } else if (arg == "--pool-size") {
            if (!parseIntValue(arg, value, int_value)) return 1;
            args.pool_size = int_value;
        } else if (arg == "--seed") {
            uint64_t seed = 0;
            if (!parseSeedValue(value, seed)) return 1;
            args.seed = seed;
        } else if (arg == "--ai-command") {
            args.ai_command = value;
        } else if (arg == "--ffmpeg") {
            args.ffmpeg_path = value;
        } else if (arg == "--preset") {
            args.preset = value;
        } else {
            LOG_CERR("Error: Unknown option: " << arg) << std::endl;
            LOG_CERR("Use --help for usage information.") << std::endl;
            return 1;
        }
    }

    return 0;
}

void applyArguments(const Arguments& args, RunConfig& config) {
    FrameSpec& frame = config.frame;
    if (!args.output_path.empty()) config.output_path = args.output_path;
    if (args.highlight) config.highlight_text = *args.highlight;
    if (args.width) frame.width = *args.width;
    if (args.height) frame.height = *args.height;
    if (args.fps) frame.fps = *args.fps;
    if (args.duration) frame.duration_seconds = *args.duration;
    if (args.density) config.density = *args.density;
    if (args.font_size_ratio) frame.font_size_ratio = *args.font_size_ratio;
    if (args.vertical_spread) frame.vertical_spread = *args.vertical_spread;
    if (args.highlight_color) frame.highlight_color = *args.highlight_color;
    if (args.text_color) frame.text_color = *args.text_color;
    if (args.background_color) frame.background_color = *args.background_color;
    if (args.blur_mode) frame.blur_mode = *args.blur_mode;
    if (args.blur_radius) frame.blur_radius = *args.blur_radius;
    if (args.texture) frame.background_texture = *args.texture;
    if (args.media_dir) frame.media_dir = *args.media_dir;
    if (args.font_dir) config.font_dir = *args.font_dir;
    if (args.selected_font) config.selected_font = *args.selected_font;
    if (args.system_font_fallback) config.system_font_fallback = *args.system_font_fallback;
    if (args.min_lines) config.text.min_lines = *args.min_lines;
    if (args.max_lines) config.text.max_lines = *args.max_lines;
    if (args.frames_per_snippet) config.frames_per_snippet = *args.frames_per_snippet;
    if (args.pool_size) config.pool_size = *args.pool_size;
    if (args.seed) {
        frame.seed = *args.seed;
        config.seed_set = true;
    }
    if (args.ai_command) config.ai_command = *args.ai_command;
    if (args.ffmpeg_path) config.ffmpeg_path = *args.ffmpeg_path;
    if (args.preset) config.encoder_preset = *args.preset;
}
