#include "core/Method.hpp"

std::optional<Method> methodFromToken(const std::string& token) {
    if (token == "GET")    return Method::GET;
    if (token == "POST")   return Method::POST;
    if (token == "PUT")    return Method::PUT;
    if (token == "PATCH")  return Method::PATCH;
    if (token == "OPTION") return Method::OPTION;
    if (token == "DELETE") return Method::DELETE;
    return std::nullopt;
}

std::string toString(Method m) {
    switch (m) {
        case Method::GET:    return "GET";
        case Method::POST:   return "POST";
        case Method::PUT:    return "PUT";
        case Method::PATCH:  return "PATCH";
        case Method::OPTION: return "OPTION";
        case Method::DELETE: return "DELETE";
    }
    return "GET";
}
