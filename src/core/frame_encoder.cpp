#include "frame_encoder.h"
#include "../utils/logging.h"
#include "include/encode/SkPngEncoder.h"

EncodedFrame encodeFrame(const sk_sp<SkImage>& image, int frame_index) {
    EncodedFrame result;
    result.frame_index = frame_index;
    if (!image) {
        return result;
    }

    SkPngEncoder::Options png_options;
    png_options.fZLibLevel = 1;
    result.png_data = SkPngEncoder::Encode(nullptr, image.get(), png_options);
    result.has_png = (result.png_data != nullptr && result.png_data->size() > 0);

    if (frame_index == 0 && result.has_png) {
        LOG_DEBUG("Frame 0 PNG encoded: " << result.png_data->size() << " bytes");
    }
    return result;
}
