#ifndef BLUR_H
#define BLUR_H

#include "include/core/SkColor.h"
#include "include/core/SkImage.h"
#include "include/core/SkRefCnt.h"

// Gaussian blur with sigma = radius. The image is padded by 3 * radius with
// pad_color first so the borders do not darken, then cropped back.
sk_sp<SkImage> blurPadded(const sk_sp<SkImage>& image, float radius, SkColor pad_color);

// Alpha-only mask: opaque disk of radius min(W,H) * sharp_factor around the
// center, fading out over a further 0.15 * max(W,H).
sk_sp<SkImage> makeRadialMask(int width, int height, float sharp_factor);

// sharp inside the mask, blurred outside, blended across the fade band
sk_sp<SkImage> compositeRadial(const sk_sp<SkImage>& sharp,
                               const sk_sp<SkImage>& blurred,
                               const sk_sp<SkImage>& mask);

// Darken the edges. intensity 0 leaves the image untouched.
sk_sp<SkImage> applyVignette(const sk_sp<SkImage>& image, float intensity);

// Image enhancement helpers (factor 1 = unchanged)
sk_sp<SkImage> adjustBrightness(const sk_sp<SkImage>& image, float factor);
sk_sp<SkImage> adjustContrast(const sk_sp<SkImage>& image, float factor);
sk_sp<SkImage> adjustSharpness(const sk_sp<SkImage>& image, float factor);

// Mean Rec. 601 luma in [0, 1]
float meanLuminance(const sk_sp<SkImage>& image);

#endif // BLUR_H
