// Render a short video of blurred filler text with one highlighted phrase
// held sharp in the center of every frame, and encode it with ffmpeg.
// Usage: matchcut [options] --highlight <text> <output.mp4>

#include "utils/logging.h"
#include "utils/crash_handler.h"
#include "utils/version.h"
#include "core/argument_parser.h"
#include "core/run_config.h"
#include "core/video_generator.h"

int main(int argc, char* argv[]) {
    installCrashHandlers();
    installExceptionHandlers();

    // Parse command-line arguments
    Arguments args;
    int parse_result = parseArguments(argc, argv, args);
    if (parse_result != 0) {
        // 2 = help shown, 1 = parse error
        return parse_result;
    }

    // Set global flags (affect logging behavior)
    g_debug_mode = args.debug_mode;
    g_quiet_mode = args.quiet_mode;

    if (args.show_version) {
        std::cout << "matchcut " << getMatchcutVersion() << std::endl;
        return 0;
    }

    RunConfig config;
    std::string errorMsg;
    if (!args.config_file.empty() && !loadRunConfigFile(args.config_file, config, errorMsg)) {
        LOG_ERROR(errorMsg);
        return 1;
    }
    applyArguments(args, config);
    if (config.output_path.empty()) {
        LOG_ERROR("No output file given");
        printUsage(argv[0]);
        return 1;
    }
    finalizeRunConfig(config);
    if (!validateRunConfig(config, errorMsg)) {
        LOG_ERROR("Invalid configuration: " << errorMsg);
        LOG_CERR("Use --help for usage information.") << std::endl;
        return 1;
    }

    LOG_INFO("matchcut " << getMatchcutVersion() << ": " << config.frame.width << "x" << config.frame.height
             << ", " << config.frame.totalFrames() << " frames, blur " << blurModeName(config.frame.blur_mode)
             << ", seed " << config.frame.seed);

    GenerationResult result = generateVideo(config);

    if (!result.failed_fonts.empty()) {
        LOG_WARN(result.failed_fonts.size() << " font(s) failed during this run:");
        for (const auto& path : result.failed_fonts) {
            LOG_CERR("  " << path) << std::endl;
        }
    }

    if (!result.success()) {
        LOG_ERROR(errorKindName(result.error) << ": " << result.message);
        return 1;
    }

    if (result.short_video) {
        LOG_WARN("Only " << result.frames_encoded << " of " << result.frames_requested
                 << " frames were encoded; the video is shorter than requested");
    }
    LOG_INFO("Video written to " << result.output_path << " (" << result.frames_encoded << " frames, "
             << result.distinct_snippets << " distinct snippets, seed " << result.seed << ")");
    return 0;
}
