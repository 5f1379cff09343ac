#include "video_generator.h"
#include "video_encoder.h"
#include "../render/frame_compositor.h"
#include "../text/ai_text_provider.h"
#include "../text/procedural_text_provider.h"
#include "../text/snippet_pool.h"
#include "../utils/crash_handler.h"
#include "../utils/logging.h"
#include <algorithm>
#include <set>

namespace {

// Independent random streams derived from the run seed
const uint64_t kTextStream = 1;
const uint64_t kFrameStream = 2;

GenerationResult failWith(GenerationResult result, ErrorKind kind, const std::string& message) {
    result.error = kind;
    result.message = message;
    return result;
}

}  // namespace

std::unique_ptr<TextProvider> makeTextProvider(const RunConfig& config, RandomSource& rng) {
    auto procedural = std::make_unique<ProceduralTextProvider>(rng, config.text.min_chars, config.text.max_chars);
    if (config.ai_command.empty()) {
        return procedural;
    }
    LOG_DEBUG("AI text enabled via command: " << config.ai_command);
    auto ai = std::make_unique<AiTextProvider>(std::make_unique<CommandTextClient>(config.ai_command),
                                               config.text.min_chars, config.text.max_chars, config.ai_attempts);
    return std::make_unique<FallbackTextProvider>(std::move(ai), std::move(procedural));
}

VideoGenerator::VideoGenerator(const RunConfig& config, FontCatalog& catalog, TextProvider& provider)
    : config_(config),
      catalog_(catalog),
      provider_(provider),
      rng_(RandomSource(config.frame.seed).fork(kFrameStream)) {}

GenerationResult VideoGenerator::renderFrames(std::vector<EncodedFrame>& frames) {
    const FrameSpec& spec = config_.frame;
    GenerationResult result;
    result.output_path = config_.output_path;
    result.seed = spec.seed;
    result.frames_requested = spec.totalFrames();

    SnippetPool pool(provider_, config_.highlight_text, config_.text.min_lines, config_.text.max_lines,
                     config_.pool_size, config_.frames_per_snippet);
    FrameCompositor compositor(spec, config_.highlight_text);
    std::set<std::string> failed_fonts;

    auto finish = [&](GenerationResult r) {
        r.distinct_snippets = pool.created();
        r.failed_fonts.assign(failed_fonts.begin(), failed_fonts.end());
        return r;
    };

    const int total = result.frames_requested;
    const int progress_step = std::max(1, total / 10);
    LOG_DEBUG("Rendering " << total << " frames (" << spec.width << "x" << spec.height << " @ "
              << spec.fps << " fps, font size " << spec.font_size << ")");

    for (int frame_index = 0; frame_index < total; frame_index++) {
        std::string errorMsg;
        if (!pool.tick(errorMsg)) {
            return finish(failWith(result, ErrorKind::TextGeneration, errorMsg));
        }
        const TextSnippet& snippet = pool.current();

        const float jitter = spec.jitter_max > spec.jitter_min
            ? static_cast<float>(rng_.nextDouble(spec.jitter_min, spec.jitter_max))
            : spec.jitter_min;

        RenderResult rendered;
        bool done = false;
        for (int attempt = 1; attempt <= config_.max_font_retries && !done; attempt++) {
            auto path = catalog_.selectPreferring(config_.font_dir, config_.selected_font, failed_fonts, rng_);
            if (!path) {
                return finish(failWith(result, ErrorKind::FontExhaustion,
                                       "frame " + std::to_string(frame_index) + ": no usable font remains (" +
                                       std::to_string(failed_fonts.size()) + " failed)"));
            }

            FontLoadResult loaded = catalog_.loadForSize(*path, static_cast<float>(spec.font_size));
            if (!loaded.success()) {
                LOG_WARN(errorKindName(loaded.error) << ": " << loaded.message);
                failed_fonts.insert(*path);
                continue;
            }

            rendered = compositor.render(snippet, loaded.font, frame_index, jitter);
            if (rendered.success()) {
                done = true;
            } else if (rendered.error == ErrorKind::FontDraw) {
                LOG_WARN(errorKindName(rendered.error) << ": " << rendered.message);
                failed_fonts.insert(*path);
            } else {
                return finish(failWith(result, rendered.error, rendered.message));
            }
        }
        if (!done) {
            return finish(failWith(result, ErrorKind::FontExhaustion,
                                   "frame " + std::to_string(frame_index) + ": font retries exhausted after " +
                                   std::to_string(config_.max_font_retries) + " attempts"));
        }

        EncodedFrame encoded = encodeFrame(rendered.image, frame_index);
        if (!encoded.has_png) {
            return finish(failWith(result, ErrorKind::Encoding,
                                   "frame " + std::to_string(frame_index) + ": PNG encoding failed"));
        }
        frames.push_back(std::move(encoded));
        result.frames_rendered++;

        if ((frame_index + 1) % progress_step == 0 || frame_index + 1 == total) {
            LOG_COUT("Rendered frame " << (frame_index + 1) << "/" << total
                     << " (snippet " << snippet.id << ")") << std::endl;
        }
    }

    LOG_DEBUG("Rendered " << result.frames_rendered << " frames with " << catalog_.cachedFontCount()
              << " loaded font(s), " << failed_fonts.size() << " failed");
    return finish(result);
}

GenerationResult VideoGenerator::run() {
    std::vector<EncodedFrame> frames;
    GenerationResult result = renderFrames(frames);
    if (!result.success()) {
        return result;
    }

    EncoderOptions options;
    options.ffmpeg_path = config_.ffmpeg_path;
    options.preset = config_.encoder_preset;
    options.fps = config_.frame.fps;
    options.expected_frames = result.frames_requested;

    setCrashCleanupPath(config_.output_path);
    EncodeResult encoded = VideoEncoder(options).encode(frames, config_.output_path);
    setCrashCleanupPath("");

    if (!encoded.success()) {
        return failWith(result, encoded.error, encoded.message);
    }
    result.frames_encoded = encoded.frames_written;
    result.short_video = encoded.short_sequence;
    return result;
}

GenerationResult generateVideo(const RunConfig& config) {
    FontCatalog catalog(config.system_font_fallback);
    if (catalog.discover(config.font_dir) == 0) {
        LOG_WARN("No fonts found in " << config.font_dir << " or on the system");
    }

    RandomSource text_rng = RandomSource(config.frame.seed).fork(kTextStream);
    std::unique_ptr<TextProvider> provider = makeTextProvider(config, text_rng);

    VideoGenerator generator(config, catalog, *provider);
    return generator.run();
}
