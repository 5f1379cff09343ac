#include "crash_handler.h"
#include <csignal>
#include <execinfo.h>
#include <unistd.h>
#include <cstdio>
#include <cstring>
#include <new>
#include <exception>
#include <stdexcept>
#include <cstdlib>

// Fixed buffer so the signal handler never allocates
static char g_cleanup_path[4096] = {0};

static void removePartialOutput() {
    if (g_cleanup_path[0] != '\0') {
        unlink(g_cleanup_path);
        dprintf(STDERR_FILENO, "[ERROR] Removed partial output: %s\n", g_cleanup_path);
        g_cleanup_path[0] = '\0';
    }
}

static void matchcutCrashHandler(int sig) {
    void* frames[128];
    int n = backtrace(frames, 128);

    const char* name = "UNKNOWN";
    switch (sig) {
        case SIGSEGV: name = "SIGSEGV"; break;
        case SIGABRT: name = "SIGABRT"; break;
        case SIGILL:  name = "SIGILL";  break;
        case SIGFPE:  name = "SIGFPE";  break;
        case SIGBUS:  name = "SIGBUS";  break;
        case SIGTERM: name = "SIGTERM"; break;
        case SIGINT:  name = "SIGINT";  break;
    }

    dprintf(STDERR_FILENO, "[ERROR] Caught signal %d (%s). Backtrace (%d frames):\n", sig, name, n);
    backtrace_symbols_fd(frames, n, STDERR_FILENO);
    removePartialOutput();

    _exit(128 + sig);
}

static void terminateHandler() {
    void* frames[128];
    int n = backtrace(frames, 128);

    dprintf(STDERR_FILENO, "[ERROR] Unhandled C++ exception. Backtrace (%d frames):\n", n);
    backtrace_symbols_fd(frames, n, STDERR_FILENO);

    auto current_exception = std::current_exception();
    if (current_exception) {
        try {
            std::rethrow_exception(current_exception);
        } catch (const std::bad_alloc& e) {
            dprintf(STDERR_FILENO, "[ERROR] Out of memory: %s\n", e.what());
            dprintf(STDERR_FILENO, "[ERROR] All frames are held in memory until encoding; lower the resolution or duration.\n");
        } catch (const std::logic_error& e) {
            dprintf(STDERR_FILENO, "[ERROR] Internal invariant violated: %s\n", e.what());
        } catch (const std::exception& e) {
            dprintf(STDERR_FILENO, "[ERROR] Exception: %s\n", e.what());
        } catch (...) {
            dprintf(STDERR_FILENO, "[ERROR] Unknown exception type\n");
        }
    } else {
        dprintf(STDERR_FILENO, "[ERROR] No active exception (std::terminate called directly)\n");
    }

    removePartialOutput();
    std::abort();
}

void installCrashHandlers() {
    std::signal(SIGSEGV, matchcutCrashHandler);
    std::signal(SIGILL,  matchcutCrashHandler);
    std::signal(SIGFPE,  matchcutCrashHandler);
    std::signal(SIGBUS,  matchcutCrashHandler);
    std::signal(SIGTERM, matchcutCrashHandler);
    std::signal(SIGINT,  matchcutCrashHandler);
    // A broken ffmpeg pipe is reported through fwrite/pclose, not as a signal
    std::signal(SIGPIPE, SIG_IGN);
}

void installExceptionHandlers() {
    std::set_terminate(terminateHandler);
}

void setCrashCleanupPath(const std::string& path) {
    if (path.size() >= sizeof(g_cleanup_path)) {
        g_cleanup_path[0] = '\0';
        return;
    }
    std::memcpy(g_cleanup_path, path.c_str(), path.size() + 1);
}
