#include "frame_compositor.h"
#include "background.h"
#include "blur.h"
#include "../utils/logging.h"
#include "../utils/random_source.h"
#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkFont.h"
#include "include/core/SkFontTypes.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkPaint.h"
#include "include/core/SkSurface.h"
#include <stdexcept>

namespace {

SkColor toSkColor(const RgbColor& color) {
    return SkColorSetRGB(color.r, color.g, color.b);
}

void drawBackgroundText(SkCanvas* canvas, const TextLayout& layout, const SkFont& font, SkColor text_color) {
    SkPaint shadow;
    shadow.setAntiAlias(true);
    shadow.setColor(SkColorSetARGB(100, 0x33, 0x33, 0x33));
    SkPaint paint;
    paint.setAntiAlias(true);
    paint.setColor(text_color);

    const float offset = static_cast<float>(layout.shadow_offset);
    for (const auto& line : layout.lines) {
        canvas->drawSimpleText(line.text.c_str(), line.text.size(), SkTextEncoding::kUTF8,
                               line.x + offset, line.baseline + offset, font, shadow);
        canvas->drawSimpleText(line.text.c_str(), line.text.size(), SkTextEncoding::kUTF8,
                               line.x, line.baseline, font, paint);
    }
}

void drawHighlightOverlay(SkCanvas* canvas, const TextLayout& layout, const SkFont& bold,
                          SkColor box_color, SkColor text_color) {
    SkPaint box;
    box.setAntiAlias(true);
    box.setColor(box_color);
    canvas->drawRect(layout.highlightBox(), box);

    SkPaint paint;
    paint.setAntiAlias(true);
    paint.setColor(text_color);
    canvas->drawSimpleText(layout.phrase.c_str(), layout.phrase.size(), SkTextEncoding::kUTF8,
                           layout.highlight_x, layout.highlight_baseline, bold, paint);
}

}  // namespace

FrameCompositor::FrameCompositor(const FrameSpec& spec, const std::string& highlight)
    : spec_(spec), highlight_(highlight) {
    if (!spec_.background_texture.empty() && spec_.background_texture != "none") {
        texture_ = loadTexture(spec_.media_dir, spec_.background_texture, spec_.width, spec_.height);
        if (!texture_) {
            LOG_WARN("Texture \"" << spec_.background_texture << "\" unavailable, using procedural paper");
        }
    }
}

sk_sp<SkImage> FrameCompositor::background(int frame_index) const {
    if (texture_) {
        return texture_;
    }
    RandomSource rng = RandomSource(spec_.seed).fork(static_cast<uint64_t>(frame_index));
    return makePaperTexture(spec_, rng);
}

RenderResult FrameCompositor::render(const TextSnippet& snippet, const FontHandle& font, int frame_index, float jitter) const {
    RenderResult result;

    LayoutResult layout = computeTextLayout(snippet, highlight_, font, spec_, jitter);
    if (!layout.success()) {
        result.error = layout.error;
        result.message = "frame " + std::to_string(frame_index) + ": " + layout.message;
        return result;
    }
    result.layout = layout.layout;

    try {
        // Background copy with every full line at regular weight. Images are
        // immutable, so the base and sharp copies share one snapshot.
        auto surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(spec_.width, spec_.height));
        if (!surface) {
            throw std::runtime_error("Failed to create frame surface");
        }
        SkCanvas* canvas = surface->getCanvas();
        canvas->clear(toSkColor(spec_.background_color));
        canvas->drawImage(background(frame_index), 0, 0);
        drawBackgroundText(canvas, result.layout, font.regularFont(), toSkColor(spec_.text_color));

        sk_sp<SkImage> base = applyVignette(surface->makeImageSnapshot(), spec_.vignette_intensity);
        const sk_sp<SkImage>& sharp = base;

        sk_sp<SkImage> composed;
        switch (spec_.blur_mode) {
            case BlurMode::None:
                composed = base;
                break;
            case BlurMode::Gaussian:
                composed = blurPadded(base, spec_.blur_radius, toSkColor(spec_.background_color));
                break;
            case BlurMode::Radial: {
                sk_sp<SkImage> blurred = blurPadded(base, spec_.blur_radius * 1.5f, toSkColor(spec_.background_color));
                sk_sp<SkImage> mask = makeRadialMask(spec_.width, spec_.height, spec_.radial_sharp_radius_factor);
                composed = compositeRadial(sharp, blurred, mask);
                break;
            }
        }

        // The phrase itself is always drawn sharp, on top of everything
        auto overlay = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(spec_.width, spec_.height));
        if (!overlay) {
            throw std::runtime_error("Failed to create overlay surface");
        }
        overlay->getCanvas()->drawImage(composed, 0, 0);
        drawHighlightOverlay(overlay->getCanvas(), result.layout, font.boldFont(),
                             toSkColor(spec_.highlight_color), toSkColor(spec_.text_color));

        sk_sp<SkImage> finished = adjustContrast(overlay->makeImageSnapshot(), 1.1f);
        result.image = adjustSharpness(finished, 1.2f);
    } catch (const std::runtime_error& e) {
        result.error = ErrorKind::Render;
        result.message = "frame " + std::to_string(frame_index) + ": " + e.what();
        result.image = nullptr;
        return result;
    }

    if (frame_index == 0) {
        LOG_DEBUG("Frame 0 composed: " << spec_.width << "x" << spec_.height << ", blur "
                  << blurModeName(spec_.blur_mode) << ", " << (texture_ ? "texture" : "paper") << " background");
    }
    return result;
}
