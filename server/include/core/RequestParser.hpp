#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "core/Request.hpp"

struct ParserLimits {
    std::size_t maxLineLength  = 8192;  // bytes, CRLF excluded
    std::size_t maxHeaderCount = 100;

    // Whole header block, measured across reads. 0 disables the deadline.
    std::chrono::milliseconds headerTimeout{10000};
};

// Blocking source of request bytes (a client socket in production).
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Reads up to `len` bytes. Returns 0 at end of stream, throws IoError on failure.
    virtual std::size_t read(char* buf, std::size_t len) = 0;
};

// CRLF line state machine: request line, then headers until a blank line.
// The body is never read.
class RequestParser {
public:
    explicit RequestParser(ParserLimits limits = ParserLimits{});

    // Consumes bytes up to and including the blank line that ends the header
    // block. Returns how many bytes of `data` were used.
    std::size_t feed(const char* data, std::size_t len);

    bool done() const { return state == State::Done; }

    // Only valid once done().
    Request take();

    // Whole-buffer helper; throws ParsingError if `raw` ends before the blank line.
    static Request parse(const std::string& raw, ParserLimits limits = ParserLimits{});

    // Pulls from `src` until the header block is complete. Throws IoError when
    // the block takes longer than limits.headerTimeout.
    static Request readFrom(ByteSource& src, ParserLimits limits = ParserLimits{});

private:
    enum class State { RequestLine, Headers, Done };

    void onLine(const std::string& line);
    void parseRequestLine(const std::string& line);
    void parseRequestTarget(const std::string& target);

    State        state = State::RequestLine;
    ParserLimits limits;
    std::string  pending;
    std::size_t  headerCount = 0;
    Request      req;
};
