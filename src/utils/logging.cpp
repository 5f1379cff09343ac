#include "logging.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>

std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    #ifdef _WIN32
        localtime_s(&tm_buf, &time_t);
    #else
        localtime_r(&time_t, &tm_buf);
    #endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::ostream& getNullStream() {
    // An ostream without a streambuf sets badbit and drops all output
    static std::ostream null_stream(nullptr);
    return null_stream;
}

// Global flags
bool g_debug_mode = false;
bool g_quiet_mode = false;
