#ifndef VIDEO_ENCODER_H
#define VIDEO_ENCODER_H

#include "errors.h"
#include "frame_encoder.h"
#include <string>
#include <vector>

struct EncoderOptions {
    std::string ffmpeg_path = "ffmpeg";
    std::string preset = "medium";
    int fps = 10;
    int expected_frames = 0;   // frames the run asked for; fewer is a warning
};

struct EncodeResult {
    std::string output_path;
    int frames_written = 0;
    bool short_sequence = false;
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool success() const { return error == ErrorKind::None; }
};

// Single-quote a string for /bin/sh
std::string shellQuote(const std::string& value);

// ffmpeg reading PNG frames from stdin and writing H.264 / yuv420p
std::string buildFfmpegCommand(const EncoderOptions& options, const std::string& output_path);

// Pipes PNG frames into an ffmpeg child process. A failed encode leaves no
// file at output_path.
class VideoEncoder {
public:
    explicit VideoEncoder(const EncoderOptions& options);

    EncodeResult encode(const std::vector<EncodedFrame>& frames, const std::string& output_path) const;

private:
    EncoderOptions options_;
};

#endif // VIDEO_ENCODER_H
