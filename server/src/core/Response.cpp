#include "core/Response.hpp"

std::string Response::build() const {
    std::string res;

    res += "HTTP/1.1 " + std::to_string(status.code) + " " + status.message + "\r\n";

    // 404/405 carry no headers at all; the wire still needs a length
    if (headers.find("Content-Length") == headers.end()) {
        res += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    }

    for (const auto& h : headers) {
        res += h.first + ": " + h.second + "\r\n";
    }

    // one request per connection
    if (headers.find("Connection") == headers.end()) {
        res += "Connection: close\r\n";
    }

    res += "\r\n";
    res += body;

    return res;
}
