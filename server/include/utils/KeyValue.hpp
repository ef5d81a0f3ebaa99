#pragma once
#include <string>
#include <utility>

// Strip spaces, tabs, CR and LF from both ends.
std::string trim(const std::string& s);

// Split `line` on the first `delim`, trimming both halves.
// Throws ParsingError when `delim` does not occur in `line`.
std::pair<std::string, std::string> splitKeyValue(const std::string& line, char delim);
