#include "core/RouteTable.hpp"

ResultType resultTypeFromTag(const std::string& tag) {
    if (tag == "direct") return ResultType::Direct;
    if (tag == "file")   return ResultType::File;
    if (tag == "dl")     return ResultType::Download;
    return ResultType::Unknown;
}

RouteTable makeRouteTable(std::vector<RouteEntry> entries) {
    return std::make_shared<const std::vector<RouteEntry>>(std::move(entries));
}
