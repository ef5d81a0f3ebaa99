#include "core/RequestParser.hpp"

#include <chrono>
#include <vector>

#include "core/Errors.hpp"
#include "utils/KeyValue.hpp"
#include "utils/Utf8.hpp"

// Split on every single space, keeping empty tokens ("a  b" -> "a", "", "b").
static std::vector<std::string> splitOn(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::size_t start = 0;

    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

RequestParser::RequestParser(ParserLimits limits) : limits(limits) {}

std::size_t RequestParser::feed(const char* data, std::size_t len) {
    std::size_t used = 0;

    while (used < len && state != State::Done) {
        char c = data[used++];
        pending.push_back(c);

        if (c == '\n' && pending.size() >= 2 && pending[pending.size() - 2] == '\r') {
            pending.resize(pending.size() - 2);
            std::string line;
            line.swap(pending);
            onLine(line);
            continue;
        }

        // one byte of slack for a trailing '\r' whose '\n' has not arrived yet
        if (pending.size() - 1 > limits.maxLineLength) {
            throw ParsingError("line exceeds " + std::to_string(limits.maxLineLength) + " bytes");
        }
    }

    return used;
}

Request RequestParser::take() {
    if (state != State::Done) {
        throw ParsingError("request header block is incomplete");
    }
    return std::move(req);
}

void RequestParser::onLine(const std::string& line) {
    if (line.size() > limits.maxLineLength) {
        throw ParsingError("line exceeds " + std::to_string(limits.maxLineLength) + " bytes");
    }
    if (!isValidUtf8(line)) {
        throw ParsingError("invalid utf-8 in request line or header");
    }
    // only CRLF ends a line; a stray CR or LF inside one is never accepted
    if (line.find_first_of("\r\n") != std::string::npos) {
        throw ParsingError("bare CR or LF inside a line");
    }

    if (state == State::RequestLine) {
        parseRequestLine(line);
        state = State::Headers;
        return;
    }

    // -------- Headers --------
    if (line.empty()) {
        state = State::Done;  // bare CRLF: end of header block
        return;
    }

    if (++headerCount > limits.maxHeaderCount) {
        throw ParsingError("more than " + std::to_string(limits.maxHeaderCount) + " headers");
    }

    auto header = splitKeyValue(line, ':');
    req.headers[header.first] = header.second;
}

void RequestParser::parseRequestLine(const std::string& line) {
    auto tokens = splitOn(line, ' ');

    req.methodToken = tokens.size() > 0 ? tokens[0] : "";
    std::string target = tokens.size() > 1 ? tokens[1] : "";
    req.version = tokens.size() > 2 ? tokens[2] : "";

    req.method = methodFromToken(req.methodToken);
    parseRequestTarget(target);
}

void RequestParser::parseRequestTarget(const std::string& target) {
    auto q = target.find('?');
    req.uri = target.substr(0, q);

    if (q == std::string::npos) return;

    for (const auto& segment : splitOn(target.substr(q + 1), '&')) {
        auto kv = splitKeyValue(segment, '=');
        req.queryStrings[kv.first] = kv.second;
    }
}

Request RequestParser::parse(const std::string& raw, ParserLimits limits) {
    RequestParser parser(limits);
    parser.feed(raw.data(), raw.size());

    if (!parser.done()) {
        throw ParsingError("request ended before the blank line");
    }
    return parser.take();
}

Request RequestParser::readFrom(ByteSource& src, ParserLimits limits) {
    RequestParser parser(limits);
    char buffer[4096];

    auto start = std::chrono::steady_clock::now();

    while (!parser.done()) {
        std::size_t n = src.read(buffer, sizeof(buffer));
        if (n == 0) {
            throw IoError("connection closed before end of headers");
        }
        // bytes after the blank line belong to a body we never read
        parser.feed(buffer, n);

        if (!parser.done() && limits.headerTimeout.count() > 0 &&
            std::chrono::steady_clock::now() - start > limits.headerTimeout) {
            throw IoError("header block not complete within " +
                          std::to_string(limits.headerTimeout.count()) + " ms");
        }
    }

    return parser.take();
}
