#include <gtest/gtest.h>

#include "render/blur.h"
#include "include/core/SkBitmap.h"
#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkPaint.h"
#include "include/core/SkPoint.h"
#include "include/core/SkRect.h"
#include "include/core/SkSurface.h"

namespace {

sk_sp<SkImage> solidImage(int width, int height, SkColor color) {
    auto surface = SkSurfaces::Raster(SkImageInfo::MakeN32Premul(width, height));
    surface->getCanvas()->clear(color);
    return surface->makeImageSnapshot();
}

SkBitmap readRgba(const sk_sp<SkImage>& image) {
    SkBitmap bitmap;
    bitmap.allocPixels(SkImageInfo::Make(image->width(), image->height(),
                                         kRGBA_8888_SkColorType, kUnpremul_SkAlphaType));
    EXPECT_TRUE(image->readPixels(nullptr, bitmap.pixmap(), 0, 0));
    return bitmap;
}

SkBitmap readAlpha(const sk_sp<SkImage>& image) {
    SkBitmap bitmap;
    bitmap.allocPixels(SkImageInfo::MakeA8(image->width(), image->height()));
    EXPECT_TRUE(image->readPixels(nullptr, bitmap.pixmap(), 0, 0));
    return bitmap;
}

}  // namespace

TEST(BlurTest, ZeroRadiusReturnsSameImage) {
    auto image = solidImage(32, 32, SK_ColorRED);
    EXPECT_EQ(blurPadded(image, 0.0f, SK_ColorWHITE).get(), image.get());
}

TEST(BlurTest, PaddingKeepsBordersFromDarkening) {
    auto image = solidImage(64, 48, SK_ColorWHITE);
    auto blurred = blurPadded(image, 6.0f, SK_ColorWHITE);
    ASSERT_TRUE(blurred);
    EXPECT_EQ(blurred->width(), 64);
    EXPECT_EQ(blurred->height(), 48);

    SkBitmap pixels = readRgba(blurred);
    for (auto point : {SkIPoint::Make(0, 0), SkIPoint::Make(63, 0), SkIPoint::Make(0, 47), SkIPoint::Make(63, 47)}) {
        SkColor color = pixels.getColor(point.x(), point.y());
        EXPECT_GE(SkColorGetR(color), 254);
        EXPECT_GE(SkColorGetG(color), 254);
        EXPECT_GE(SkColorGetB(color), 254);
    }
}

TEST(BlurTest, RadialMaskIsOpaqueAtCenterAndFadesOutward) {
    const int width = 200;
    const int height = 160;
    auto mask = makeRadialMask(width, height, 0.3f);
    ASSERT_TRUE(mask);
    SkBitmap alpha = readAlpha(mask);

    EXPECT_GE(*alpha.getAddr8(width / 2, height / 2), 250);
    EXPECT_LE(*alpha.getAddr8(0, 0), 2);
    EXPECT_LE(*alpha.getAddr8(width - 1, height - 1), 2);

    const int y = height / 2;
    int previous = *alpha.getAddr8(width / 2, y);
    for (int x = width / 2 + 1; x < width; x++) {
        const int value = *alpha.getAddr8(x, y);
        EXPECT_LE(value, previous + 1) << "at x=" << x;
        previous = value;
    }
}

TEST(BlurTest, RadialCompositeUsesSharpCenterAndBlurredEdge) {
    auto sharp = solidImage(100, 100, SK_ColorRED);
    auto blurred = solidImage(100, 100, SK_ColorBLUE);
    auto mask = makeRadialMask(100, 100, 0.3f);
    SkBitmap pixels = readRgba(compositeRadial(sharp, blurred, mask));

    SkColor center = pixels.getColor(50, 50);
    EXPECT_GE(SkColorGetR(center), 245);
    EXPECT_LE(SkColorGetB(center), 10);

    SkColor corner = pixels.getColor(0, 0);
    EXPECT_LE(SkColorGetR(corner), 10);
    EXPECT_GE(SkColorGetB(corner), 245);
}

TEST(BlurTest, VignetteDarkensEdgesOnly) {
    auto image = solidImage(120, 120, SK_ColorWHITE);
    EXPECT_EQ(applyVignette(image, 0.0f).get(), image.get());

    SkBitmap pixels = readRgba(applyVignette(image, 0.5f));
    EXPECT_LT(SkColorGetR(pixels.getColor(0, 0)), 230);
    EXPECT_GE(SkColorGetR(pixels.getColor(60, 60)), 250);
}

TEST(BlurTest, MeanLuminance) {
    EXPECT_NEAR(meanLuminance(solidImage(16, 16, SK_ColorWHITE)), 1.0f, 1e-3f);
    EXPECT_NEAR(meanLuminance(solidImage(16, 16, SK_ColorBLACK)), 0.0f, 1e-3f);
    EXPECT_NEAR(meanLuminance(solidImage(16, 16, SkColorSetRGB(255, 0, 0))), 0.299f, 1e-2f);
}

TEST(BlurTest, EnhancementsLeaveFlatImagesAlone) {
    auto gray = solidImage(24, 24, SkColorSetRGB(128, 128, 128));
    // Contrast pivots on the mean, sharpening on the neighbourhood
    SkBitmap contrasted = readRgba(adjustContrast(gray, 1.5f));
    EXPECT_NEAR(SkColorGetR(contrasted.getColor(12, 12)), 128, 2);
    SkBitmap sharpened = readRgba(adjustSharpness(gray, 1.2f));
    EXPECT_NEAR(SkColorGetG(sharpened.getColor(12, 12)), 128, 2);

    SkBitmap brighter = readRgba(adjustBrightness(gray, 1.5f));
    EXPECT_NEAR(SkColorGetB(brighter.getColor(0, 0)), 192, 2);
}
