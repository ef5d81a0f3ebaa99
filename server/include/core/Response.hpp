#pragma once
#include <string>
#include <unordered_map>

#include "core/HttpStatus.hpp"

class Response {
public:
    Status status;

    std::unordered_map<std::string, std::string> headers;
    std::string body;  // raw bytes

    Response() = default;
    Response(Status status, std::string body) : status(std::move(status)), body(std::move(body)) {}

    // Wire form: status line, headers, blank line, body.
    std::string build() const;
};
