#ifndef LOGGING_H
#define LOGGING_H

#include <string>
#include <iostream>

// Global flags
extern bool g_debug_mode;
extern bool g_quiet_mode;

// Helper macros for timestamped output
// LOG_COUT is silenced by --quiet; warnings and errors always go to stderr
#define LOG_COUT(msg) (g_quiet_mode ? getNullStream() : std::cout) << "[" << getTimestamp() << "] " << msg
#define LOG_CERR(msg) std::cerr << "[" << getTimestamp() << "] " << msg
#define LOG_DEBUG(msg) if (g_debug_mode) { LOG_CERR("[DEBUG] " << msg) << std::endl; }
#define LOG_INFO(msg) LOG_COUT("[INFO] " << msg) << std::endl
#define LOG_WARN(msg) LOG_CERR("[WARNING] " << msg) << std::endl
#define LOG_ERROR(msg) LOG_CERR("[ERROR] " << msg) << std::endl

// Get current timestamp as string in format [YYYY-MM-DD HH:MM:SS.mmm]
std::string getTimestamp();

// Stream that discards everything written to it
std::ostream& getNullStream();

#endif // LOGGING_H
