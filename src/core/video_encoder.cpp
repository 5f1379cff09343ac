#include "video_encoder.h"
#include "../utils/logging.h"
#include "../utils/string_utils.h"
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::string readTail(const std::string& path, size_t max_bytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (content.size() > max_bytes) {
        content = content.substr(content.size() - max_bytes);
    }
    return trim(content);
}

void removePartialOutput(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
        LOG_DEBUG("Removed partial output " << path);
    } else if (ec) {
        LOG_WARN("Could not remove partial output " << path << ": " << ec.message());
    }
}

}  // namespace

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string buildFfmpegCommand(const EncoderOptions& options, const std::string& output_path) {
    std::ostringstream cmd;
    cmd << shellQuote(options.ffmpeg_path)
        << " -y -loglevel error"
        << " -f image2pipe -c:v png"
        << " -r " << options.fps
        << " -i -"
        << " -c:v libx264"
        << " -preset " << shellQuote(options.preset)
        << " -pix_fmt yuv420p"
        << " " << shellQuote(output_path);
    return cmd.str();
}

VideoEncoder::VideoEncoder(const EncoderOptions& options) : options_(options) {}

EncodeResult VideoEncoder::encode(const std::vector<EncodedFrame>& frames, const std::string& output_path) const {
    EncodeResult result;
    result.output_path = output_path;

    if (frames.empty()) {
        result.error = ErrorKind::Encoding;
        result.message = "no frames to encode";
        return result;
    }
    if (options_.expected_frames > 0 && static_cast<int>(frames.size()) < options_.expected_frames) {
        result.short_sequence = true;
        LOG_WARN("Encoding " << frames.size() << " of " << options_.expected_frames
                 << " requested frames, the video will be shorter");
    }

    std::filesystem::path parent = std::filesystem::path(output_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            result.error = ErrorKind::Encoding;
            result.message = "could not create output directory " + parent.string() + ": " + ec.message();
            return result;
        }
    }

    char log_path[] = "/tmp/matchcut_ffmpeg_XXXXXX";
    int log_fd = mkstemp(log_path);
    if (log_fd < 0) {
        result.error = ErrorKind::Encoding;
        result.message = std::string("could not create encoder log: ") + std::strerror(errno);
        return result;
    }
    close(log_fd);

    const std::string cmd = buildFfmpegCommand(options_, output_path) + " 2> " + shellQuote(log_path);
    LOG_DEBUG("Encoder command: " << cmd);

    // A dying ffmpeg must surface as a short write, not kill this process
    auto previous_sigpipe = std::signal(SIGPIPE, SIG_IGN);

    FILE* pipe = popen(cmd.c_str(), "w");
    if (!pipe) {
        std::signal(SIGPIPE, previous_sigpipe);
        unlink(log_path);
        result.error = ErrorKind::Encoding;
        result.message = std::string("could not start ffmpeg: ") + std::strerror(errno);
        return result;
    }

    bool write_failed = false;
    for (const auto& frame : frames) {
        if (!frame.has_png) {
            LOG_WARN("Frame " << frame.frame_index << " has no PNG data, skipping");
            continue;
        }
        const size_t size = frame.png_data->size();
        if (fwrite(frame.png_data->data(), 1, size, pipe) != size) {
            LOG_ERROR("Failed to write frame " << frame.frame_index << " to ffmpeg");
            write_failed = true;
            break;
        }
        result.frames_written++;
    }

    int status = pclose(pipe);
    std::signal(SIGPIPE, previous_sigpipe);
    const std::string stderr_tail = readTail(log_path, 600);
    unlink(log_path);

    if (write_failed || status != 0) {
        std::ostringstream msg;
        if (write_failed) {
            msg << "ffmpeg stopped reading after " << result.frames_written << " frames";
        } else if (WIFEXITED(status)) {
            msg << "ffmpeg exited with status " << WEXITSTATUS(status);
        } else {
            msg << "ffmpeg terminated abnormally (status " << status << ")";
        }
        if (!stderr_tail.empty()) {
            msg << ": " << stderr_tail;
        }
        removePartialOutput(output_path);
        result.error = ErrorKind::Encoding;
        result.message = msg.str();
        return result;
    }

    if (result.frames_written == 0) {
        removePartialOutput(output_path);
        result.error = ErrorKind::Encoding;
        result.message = "none of the frames carried PNG data";
        return result;
    }

    LOG_DEBUG("Encoded " << result.frames_written << " frames at " << options_.fps << " fps into " << output_path);
    return result;
}
