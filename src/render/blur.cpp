#include "blur.h"
#include "../utils/logging.h"
#include "include/core/SkBitmap.h"
#include "include/core/SkCanvas.h"
#include "include/core/SkColorFilter.h"
#include "include/core/SkImageFilter.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkMaskFilter.h"
#include "include/core/SkPaint.h"
#include "include/core/SkSamplingOptions.h"
#include "include/core/SkShader.h"
#include "include/core/SkSurface.h"
#include "include/core/SkTileMode.h"
#include "include/effects/SkColorMatrix.h"
#include "include/effects/SkImageFilters.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

sk_sp<SkSurface> makeRasterSurface(int width, int height) {
    auto surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(width, height));
    if (!surface) {
        throw std::runtime_error("Failed to create " + std::to_string(width) + "x" +
                                 std::to_string(height) + " raster surface");
    }
    return surface;
}

sk_sp<SkImage> drawWithPaint(const sk_sp<SkImage>& image, const SkPaint& paint) {
    auto surface = makeRasterSurface(image->width(), image->height());
    surface->getCanvas()->drawImage(image, 0, 0, SkSamplingOptions(), &paint);
    return surface->makeImageSnapshot();
}

}  // namespace

sk_sp<SkImage> blurPadded(const sk_sp<SkImage>& image, float radius, SkColor pad_color) {
    if (radius <= 0.0f) {
        return image;
    }
    const int pad = static_cast<int>(std::ceil(radius * 3.0f));
    const int width = image->width();
    const int height = image->height();

    auto padded = makeRasterSurface(width + 2 * pad, height + 2 * pad);
    padded->getCanvas()->clear(pad_color);
    padded->getCanvas()->drawImage(image, static_cast<float>(pad), static_cast<float>(pad));

    SkPaint paint;
    paint.setImageFilter(SkImageFilters::Blur(radius, radius, nullptr));
    auto cropped = makeRasterSurface(width, height);
    cropped->getCanvas()->drawImage(padded->makeImageSnapshot(), static_cast<float>(-pad),
                                    static_cast<float>(-pad), SkSamplingOptions(), &paint);
    return cropped->makeImageSnapshot();
}

sk_sp<SkImage> makeRadialMask(int width, int height, float sharp_factor) {
    auto surface = SkSurfaces::Raster(SkImageInfo::MakeA8(width, height));
    if (!surface) {
        throw std::runtime_error("Failed to create radial mask surface");
    }
    const float sharp_radius = static_cast<float>(std::min(width, height)) * sharp_factor;
    const float fade_radius = sharp_radius + static_cast<float>(std::max(width, height)) * 0.15f;
    const float sigma = std::max(0.1f, (fade_radius - sharp_radius) / 3.5f);

    SkCanvas* canvas = surface->getCanvas();
    canvas->clear(SK_ColorTRANSPARENT);
    SkPaint paint;
    paint.setAntiAlias(true);
    paint.setColor(SK_ColorWHITE);
    paint.setMaskFilter(SkMaskFilter::MakeBlur(kNormal_SkBlurStyle, sigma));
    canvas->drawCircle(width / 2.0f, height / 2.0f, sharp_radius, paint);
    return surface->makeImageSnapshot();
}

sk_sp<SkImage> compositeRadial(const sk_sp<SkImage>& sharp,
                               const sk_sp<SkImage>& blurred,
                               const sk_sp<SkImage>& mask) {
    auto surface = makeRasterSurface(sharp->width(), sharp->height());
    SkCanvas* canvas = surface->getCanvas();
    canvas->drawImage(blurred, 0, 0);

    // An alpha-only image drawn with a shader paints the shader through its coverage
    SkPaint paint;
    paint.setShader(sharp->makeShader(SkTileMode::kClamp, SkTileMode::kClamp, SkSamplingOptions()));
    canvas->drawImage(mask, 0, 0, SkSamplingOptions(), &paint);
    return surface->makeImageSnapshot();
}

sk_sp<SkImage> applyVignette(const sk_sp<SkImage>& image, float intensity) {
    if (intensity <= 0.0f) {
        return image;
    }
    const int width = image->width();
    const int height = image->height();
    const float band = std::max(1.0f, std::min(width, height) / 4.0f);

    SkBitmap rings;
    rings.allocPixels(SkImageInfo::MakeA8(width, height));
    for (int y = 0; y < height; y++) {
        uint8_t* row = rings.getAddr8(0, y);
        for (int x = 0; x < width; x++) {
            const int edge = std::min(std::min(x, y), std::min(width - 1 - x, height - 1 - y));
            float darkness = 0.0f;
            if (edge < band) {
                const float t = 1.0f - edge / band;
                darkness = intensity * t * t;
            }
            row[x] = static_cast<uint8_t>(std::lround(std::min(1.0f, darkness) * 255.0f));
        }
    }
    rings.setImmutable();

    auto surface = makeRasterSurface(width, height);
    SkCanvas* canvas = surface->getCanvas();
    canvas->drawImage(image, 0, 0);

    const float sigma = std::max(0.1f, width / 30.0f);
    SkPaint paint;
    paint.setColor(SK_ColorBLACK);
    paint.setImageFilter(SkImageFilters::Blur(sigma, sigma, SkTileMode::kClamp, nullptr));
    canvas->drawImage(rings.asImage(), 0, 0, SkSamplingOptions(), &paint);
    return surface->makeImageSnapshot();
}

sk_sp<SkImage> adjustBrightness(const sk_sp<SkImage>& image, float factor) {
    SkColorMatrix matrix;
    matrix.setScale(factor, factor, factor, 1.0f);
    SkPaint paint;
    paint.setColorFilter(SkColorFilters::Matrix(matrix));
    return drawWithPaint(image, paint);
}

sk_sp<SkImage> adjustContrast(const sk_sp<SkImage>& image, float factor) {
    const float mean = meanLuminance(image);
    const float offset = (1.0f - factor) * mean;
    // Translation column is in normalized [0, 1] units
    const float row_major[20] = {
        factor, 0, 0, 0, offset,
        0, factor, 0, 0, offset,
        0, 0, factor, 0, offset,
        0, 0, 0, 1, 0,
    };
    SkPaint paint;
    paint.setColorFilter(SkColorFilters::Matrix(row_major));
    return drawWithPaint(image, paint);
}

sk_sp<SkImage> adjustSharpness(const sk_sp<SkImage>& image, float factor) {
    // Blend between the smoothed image (3x3, center weight 5) and the original
    const float smooth[9] = {1, 1, 1, 1, 5, 1, 1, 1, 1};
    SkScalar kernel[9];
    for (int i = 0; i < 9; i++) {
        kernel[i] = (1.0f - factor) * smooth[i] / 13.0f;
    }
    kernel[4] += factor;

    SkPaint paint;
    paint.setImageFilter(SkImageFilters::MatrixConvolution(
        SkISize::Make(3, 3), kernel, 1.0f, 0.0f, SkIPoint::Make(1, 1),
        SkTileMode::kClamp, false, nullptr));
    return drawWithPaint(image, paint);
}

float meanLuminance(const sk_sp<SkImage>& image) {
    SkBitmap bitmap;
    bitmap.allocPixels(SkImageInfo::Make(image->width(), image->height(),
                                         kRGBA_8888_SkColorType, kUnpremul_SkAlphaType));
    if (!image->readPixels(nullptr, bitmap.pixmap(), 0, 0)) {
        LOG_WARN("Could not read pixels for luminance, assuming mid gray");
        return 0.5f;
    }
    double total = 0.0;
    for (int y = 0; y < bitmap.height(); y++) {
        const uint8_t* row = static_cast<const uint8_t*>(bitmap.getAddr(0, y));
        for (int x = 0; x < bitmap.width(); x++) {
            const uint8_t* px = row + x * 4;
            total += 0.299 * px[0] + 0.587 * px[1] + 0.114 * px[2];
        }
    }
    const double pixels = static_cast<double>(bitmap.width()) * bitmap.height();
    return pixels > 0.0 ? static_cast<float>(total / pixels / 255.0) : 0.5f;
}
