#ifndef CRASH_HANDLER_H
#define CRASH_HANDLER_H

#include <string>

// Install crash handlers for signals
void installCrashHandlers();

// Install C++ exception handlers (uncaught logic_error from generators, bad_alloc, etc.)
void installExceptionHandlers();

// Register a file to unlink if the process dies while it is being written.
// Pass an empty string to clear the registration.
void setCrashCleanupPath(const std::string& path);

#endif // CRASH_HANDLER_H
