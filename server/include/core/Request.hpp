#pragma once
#include <optional>
#include <string>
#include <unordered_map>

#include "core/Method.hpp"

class Request {
public:
    // std::nullopt when the request-line token is not one of the known methods;
    // methodToken always keeps the raw token.
    std::optional<Method> method;
    std::string methodToken;

    std::string uri;      // path only, never contains '?'
    std::string version;

    std::unordered_map<std::string, std::string> headers;
    std::unordered_map<std::string, std::string> queryStrings;

    Request() = default;
};
