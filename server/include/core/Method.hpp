#pragma once
#include <optional>
#include <string>

enum class Method {
    GET,
    POST,
    PUT,
    PATCH,
    OPTION,
    DELETE
};

// Exact, case-sensitive match on the request-line token.
// Anything else (the empty token included) is std::nullopt.
std::optional<Method> methodFromToken(const std::string& token);

std::string toString(Method m);
