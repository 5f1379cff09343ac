#include "version.h"

const char* getMatchcutVersion() {
    #ifdef MATCHCUT_VERSION
    // Injected by the build (see CMakeLists.txt)
    return MATCHCUT_VERSION;
    #else
    // Format: "dev-MMM DD YYYY-HH:MM:SS"
    return "dev-" __DATE__ "-" __TIME__;
    #endif
}
