#ifndef VIDEO_GENERATOR_H
#define VIDEO_GENERATOR_H

#include "errors.h"
#include "frame_encoder.h"
#include "run_config.h"
#include "../text/font_catalog.h"
#include "../text/text_provider.h"
#include "../utils/random_source.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Summary of one run
struct GenerationResult {
    std::string output_path;
    uint64_t seed = 0;
    int frames_requested = 0;
    int frames_rendered = 0;
    int frames_encoded = 0;
    int distinct_snippets = 0;
    bool short_video = false;
    std::vector<std::string> failed_fonts;
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool success() const { return error == ErrorKind::None; }
};

// Procedural text, or AI text with procedural fallback when ai_command is set.
// rng must outlive the returned provider.
std::unique_ptr<TextProvider> makeTextProvider(const RunConfig& config, RandomSource& rng);

// Renders every frame in order and encodes them. Frames are rendered
// strictly sequentially; the font failure set only grows during a run.
class VideoGenerator {
public:
    VideoGenerator(const RunConfig& config, FontCatalog& catalog, TextProvider& provider);

    GenerationResult run();

    // Render without encoding (used by run() and by tests)
    GenerationResult renderFrames(std::vector<EncodedFrame>& frames);

private:
    const RunConfig& config_;
    FontCatalog& catalog_;
    TextProvider& provider_;
    RandomSource rng_;
};

// Full pipeline from a finalized, validated config
GenerationResult generateVideo(const RunConfig& config);

#endif // VIDEO_GENERATOR_H
