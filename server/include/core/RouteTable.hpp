#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/Method.hpp"

enum class ResultType {
    Direct,    // "direct": body is `result` verbatim
    File,      // "file":   body is the text of the file at `result`
    Download,  // "dl":     body is the bytes of the file at `result`, served as attachment
    Unknown    // any other tag: empty body
};

ResultType resultTypeFromTag(const std::string& tag);

struct RouteEntry {
    std::string path;
    Method method = Method::GET;

    std::optional<std::vector<std::string>> headers;  // required request header names
    std::optional<std::vector<std::string>> queries;  // required query parameter names

    std::optional<int> statusCode;

    ResultType  resultType = ResultType::Direct;
    std::string resultTag  = "direct";
    std::string result;

    std::optional<std::vector<std::string>> resultHeaders;  // "Key: Value"
};

// Built once at startup, then shared read-only by every connection task.
using RouteTable = std::shared_ptr<const std::vector<RouteEntry>>;

RouteTable makeRouteTable(std::vector<RouteEntry> entries);
