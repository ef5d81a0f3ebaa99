#include "utils/KeyValue.hpp"
#include "core/Errors.hpp"

static inline bool isTrimmable(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();

    while (begin < end && isTrimmable(s[begin])) ++begin;
    while (end > begin && isTrimmable(s[end - 1])) --end;

    return s.substr(begin, end - begin);
}

std::pair<std::string, std::string> splitKeyValue(const std::string& line, char delim) {
    auto pos = line.find(delim);
    if (pos == std::string::npos) {
        throw ParsingError("missing '" + std::string(1, delim) + "' in `" + line + "`");
    }

    return { trim(line.substr(0, pos)), trim(line.substr(pos + 1)) };
}
