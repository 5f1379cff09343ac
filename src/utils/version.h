#ifndef VERSION_H
#define VERSION_H

/**
 * Get the matchcut version string
 * @return Version string (e.g., "v1.2.3" or "dev-Jan 01 2024-12:00:00")
 */
const char* getMatchcutVersion();

#endif // VERSION_H
