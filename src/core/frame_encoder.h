#ifndef FRAME_ENCODER_H
#define FRAME_ENCODER_H

#include "include/core/SkData.h"
#include "include/core/SkImage.h"
#include "include/core/SkRefCnt.h"

// A rendered frame, PNG-encoded and waiting for the video encoder
struct EncodedFrame {
    int frame_index = -1;
    sk_sp<SkData> png_data;
    bool has_png = false;
};

// Encode frame image to PNG (fast zlib level; frames are consumed once by ffmpeg)
EncodedFrame encodeFrame(const sk_sp<SkImage>& image, int frame_index);

#endif // FRAME_ENCODER_H
