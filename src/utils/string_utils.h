#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <string>
#include <vector>

// Helper functions for string manipulation
size_t replaceAllInPlace(std::string& s, const std::string& from, const std::string& to);
std::string trim(const std::string& s);
std::string toLower(const std::string& s);
bool startsWith(const std::string& s, const std::string& prefix);

// Split on '\n' (a trailing '\r' is dropped from every line)
std::vector<std::string> splitLines(const std::string& text);

// Split on runs of whitespace
std::vector<std::string> splitWords(const std::string& text);

// True if the last character (ignoring closing quotes) is '.', '!' or '?'
bool hasTerminalPunctuation(const std::string& s);

#endif // STRING_UTILS_H
