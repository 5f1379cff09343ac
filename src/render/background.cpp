#include "background.h"
#include "blur.h"
#include "../utils/logging.h"
#include "include/codec/SkCodec.h"
#include "include/codec/SkJpegDecoder.h"
#include "include/codec/SkPngDecoder.h"
#include "include/core/SkBitmap.h"
#include "include/core/SkCanvas.h"
#include "include/core/SkData.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkPaint.h"
#include "include/core/SkRect.h"
#include "include/core/SkSamplingOptions.h"
#include "include/core/SkSurface.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <mutex>

namespace {

void registerImageCodecs() {
    static std::once_flag once;
    std::call_once(once, []() {
        SkCodecs::Register(SkPngDecoder::Decoder());
        SkCodecs::Register(SkJpegDecoder::Decoder());
        LOG_DEBUG("Registered image codecs via SkCodecs::Register: png, jpeg");
    });
}

uint8_t clampByte(double value) {
    return static_cast<uint8_t>(std::lround(std::min(255.0, std::max(0.0, value))));
}

}  // namespace

CoverFit computeCoverFit(int orig_width, int orig_height, int width, int height) {
    CoverFit fit;
    const double scale = std::max(static_cast<double>(width) / orig_width,
                                  static_cast<double>(height) / orig_height);
    fit.scaled_width = static_cast<int>(orig_width * scale);
    fit.scaled_height = static_cast<int>(orig_height * scale);

    fit.crop_left = fit.scaled_width > width ? (fit.scaled_width - width) / 2 : 0;
    fit.crop_top = fit.scaled_height > height ? (fit.scaled_height - height) / 2 : 0;
    fit.crop_width = std::min(width, fit.scaled_width);
    fit.crop_height = std::min(height, fit.scaled_height);
    fit.needs_resize = fit.crop_width != width || fit.crop_height != height;
    return fit;
}

std::string textureFilePath(const std::string& media_dir, const std::string& name) {
    std::filesystem::path dir(media_dir);
    if (name.rfind("custom_texture_", 0) == 0 || name.find('.') != std::string::npos) {
        return (dir / name).string();
    }
    return (dir / (name + ".jpg")).string();
}

sk_sp<SkImage> loadTexture(const std::string& media_dir, const std::string& name, int width, int height) {
    if (name.empty() || name == "none") {
        return nullptr;
    }

    const std::string path = textureFilePath(media_dir, name);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        LOG_WARN("Texture file not found: " << path);
        return nullptr;
    }

    registerImageCodecs();
    sk_sp<SkData> data = SkData::MakeFromFileName(path.c_str());
    if (!data) {
        LOG_WARN("Could not read texture file: " << path);
        return nullptr;
    }
    sk_sp<SkImage> source = SkImages::DeferredFromEncodedData(data);
    if (!source || source->width() <= 0 || source->height() <= 0) {
        LOG_WARN("Could not decode texture: " << path);
        return nullptr;
    }

    const CoverFit fit = computeCoverFit(source->width(), source->height(), width, height);
    const float to_orig_x = static_cast<float>(source->width()) / fit.scaled_width;
    const float to_orig_y = static_cast<float>(source->height()) / fit.scaled_height;
    const SkRect src = SkRect::MakeXYWH(fit.crop_left * to_orig_x, fit.crop_top * to_orig_y,
                                        fit.crop_width * to_orig_x, fit.crop_height * to_orig_y);
    // A short crop is stretched to the full frame
    const SkRect dst = SkRect::MakeWH(static_cast<float>(width), static_cast<float>(height));

    auto surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(width, height));
    if (!surface) {
        LOG_WARN("Could not allocate texture surface for " << path);
        return nullptr;
    }
    surface->getCanvas()->drawImageRect(source, src, dst, SkSamplingOptions(SkCubicResampler::CatmullRom()),
                                        nullptr, SkCanvas::kFast_SrcRectConstraint);
    sk_sp<SkImage> texture = surface->makeImageSnapshot();

    texture = adjustBrightness(texture, 1.2f);
    texture = adjustContrast(texture, 0.9f);
    LOG_DEBUG("Loaded texture " << path << " (" << source->width() << "x" << source->height()
              << " -> " << width << "x" << height << (fit.needs_resize ? ", resized" : "") << ")");
    return texture;
}

sk_sp<SkImage> makePaperTexture(const FrameSpec& spec, RandomSource& rng) {
    const int width = spec.width;
    const int height = spec.height;
    const RgbColor base = spec.background_color;

    // Grain: many small near-white dots, used as the blend mask for the noise
    SkBitmap grain;
    grain.allocPixels(SkImageInfo::MakeA8(width, height));
    grain.eraseColor(SK_ColorTRANSPARENT);
    {
        SkCanvas canvas(grain);
        SkPaint paint;
        paint.setAntiAlias(false);
        const int dots = width * height / 100;
        const int max_size = std::max(1, spec.grain_size);
        for (int i = 0; i < dots; i++) {
            const float x = static_cast<float>(rng.nextInt(0, width - 1));
            const float y = static_cast<float>(rng.nextInt(0, height - 1));
            const float size = static_cast<float>(rng.nextInt(1, max_size));
            const int brightness = rng.nextInt(200, 255);
            paint.setColor(SkColorSetARGB(static_cast<U8CPU>(brightness), 255, 255, 255));
            canvas.drawOval(SkRect::MakeXYWH(x, y, size + 1.0f, size + 1.0f), paint);
        }
    }

    SkBitmap paper;
    paper.allocPixels(SkImageInfo::Make(width, height, kRGBA_8888_SkColorType, kOpaque_SkAlphaType));
    const int shadow_width = std::max(1, width / 20);
    const double noise_sigma = std::max(0.0f, spec.noise_intensity);

    for (int y = 0; y < height; y++) {
        const uint8_t* mask_row = grain.getAddr8(0, y);
        uint8_t* row = static_cast<uint8_t*>(paper.getAddr(0, y));
        for (int x = 0; x < width; x++) {
            double r = base.r;
            double g = base.g;
            double b = base.b;

            const double m = mask_row[x] / 255.0;
            if (m > 0.0) {
                // Base blended 10% toward N(0.5, sigma) noise, shown through the grain
                const double nr = std::min(1.0, std::max(0.0, rng.nextGaussian(0.5, noise_sigma))) * 255.0;
                const double ng = std::min(1.0, std::max(0.0, rng.nextGaussian(0.5, noise_sigma))) * 255.0;
                const double nb = std::min(1.0, std::max(0.0, rng.nextGaussian(0.5, noise_sigma))) * 255.0;
                r = (r * 0.9 + nr * 0.1) * m + r * (1.0 - m);
                g = (g * 0.9 + ng * 0.1) * m + g * (1.0 - m);
                b = (b * 0.9 + nb * 0.1) * m + b * (1.0 - m);
            }

            const int edge = std::min(std::min(x, y), std::min(width - 1 - x, height - 1 - y));
            if (edge < shadow_width) {
                const double shade = 1.0 - 0.25 * (1.0 - static_cast<double>(edge) / shadow_width);
                r *= shade;
                g *= shade;
                b *= shade;
            }

            uint8_t* px = row + x * 4;
            px[0] = clampByte(r);
            px[1] = clampByte(g);
            px[2] = clampByte(b);
            px[3] = 255;
        }
    }
    paper.setImmutable();
    return paper.asImage();
}
