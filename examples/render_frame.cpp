#include <iostream>
#include <fstream>
#include "core/frame_encoder.h"
#include "core/run_config.h"
#include "render/frame_compositor.h"
#include "text/font_catalog.h"
#include "text/procedural_text_provider.h"
#include "utils/random_source.h"

// Renders a single frame to PNG, handy for checking fonts and colors
// before generating a whole video.
int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <highlight> <output.png> [font_dir]" << std::endl;
        return 1;
    }

    RunConfig config;
    config.highlight_text = argv[1];
    config.font_dir = (argc > 3) ? argv[3] : "fonts";
    finalizeRunConfig(config);

    std::string errorMsg;
    if (!validateRunConfig(config, errorMsg)) {
        std::cerr << "Invalid config: " << errorMsg << std::endl;
        return 1;
    }

    FontCatalog catalog;
    RandomSource rng(config.frame.seed);
    catalog.discover(config.font_dir);
    auto path = catalog.select({}, rng);
    if (!path) {
        std::cerr << "No fonts found" << std::endl;
        return 1;
    }
    FontLoadResult font = catalog.loadForSize(*path, static_cast<float>(config.frame.font_size));
    if (!font.success()) {
        std::cerr << font.message << std::endl;
        return 1;
    }

    ProceduralTextProvider provider(rng, config.text.min_chars, config.text.max_chars);
    TextGenerationResult text = provider.generate(config.highlight_text, config.text.min_lines, config.text.max_lines);
    if (!text.success()) {
        std::cerr << "Text generation failed: " << text.message << std::endl;
        return 1;
    }

    std::cout << "Font: " << *path << std::endl;
    std::cout << "Seed: " << config.frame.seed << std::endl;

    FrameCompositor compositor(config.frame, config.highlight_text);
    RenderResult frame = compositor.render(text.snippet, font.font, 0, 0.0f);
    if (!frame.success()) {
        std::cerr << errorKindName(frame.error) << ": " << frame.message << std::endl;
        return 1;
    }

    EncodedFrame png = encodeFrame(frame.image, 0);
    if (!png.has_png) {
        std::cerr << "PNG encoding failed" << std::endl;
        return 1;
    }
    std::ofstream out(argv[2], std::ios::binary);
    out.write(static_cast<const char*>(png.png_data->data()), static_cast<std::streamsize>(png.png_data->size()));
    if (!out) {
        std::cerr << "Could not write " << argv[2] << std::endl;
        return 1;
    }

    std::cout << "Wrote " << argv[2] << std::endl;
    return 0;
}
