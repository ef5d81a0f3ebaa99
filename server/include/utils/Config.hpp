#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "core/RequestParser.hpp"
#include "core/ResponseResolver.hpp"
#include "core/RouteTable.hpp"

class Config {
public:
    std::string  host = "0.0.0.0";
    int          port = 8080;
    int          threads = 4;
    ResolverMode mode = ResolverMode::Legacy;

    int          idleTimeoutMs = 5000;
    ParserLimits limits;

    std::string  accessLog = "data/logs/access_log.csv";

    RouteTable   routes;

    // Reads and validates a JSON config file. Throws ConfigParsingError.
    explicit Config(const std::string& path);

    static Config fromJson(const nlohmann::json& j);

private:
    Config() = default;

    void load(const nlohmann::json& j);
};

// "legacy" / "strict", case-insensitive; anything else falls back to legacy.
ResolverMode modeFromString(const std::string& s);
