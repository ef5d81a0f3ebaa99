#include "utils/Config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

#include "core/Errors.hpp"

using json = nlohmann::json;

static const long long kMaxLineLengthCap  = 1024 * 1024;
static const long long kMaxHeaderCountCap = 10000;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return s;
}

static std::optional<std::vector<std::string>> stringList(const json& route, const char* key) {
    if (!route.contains(key) || route[key].is_null()) return std::nullopt;

    const json& arr = route[key];
    if (!arr.is_array()) {
        throw ConfigParsingError(std::string("`") + key + "` must be an array of strings");
    }

    std::vector<std::string> out;
    for (const auto& item : arr) {
        if (!item.is_string()) {
            throw ConfigParsingError(std::string("`") + key + "` must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

static RouteEntry parseRoute(const json& r, std::size_t index) {
    const std::string where = "data[" + std::to_string(index) + "]";

    if (!r.is_object()) {
        throw ConfigParsingError(where + " is not an object");
    }

    RouteEntry e;
    try {
        e.path = r.at("path").get<std::string>();

        std::string method = r.value("method", std::string("GET"));
        auto m = methodFromToken(method);
        if (!m) {
            throw ConfigParsingError(where + ": unknown method `" + method + "`");
        }
        e.method = *m;

        e.headers = stringList(r, "headers");
        e.queries = stringList(r, "queries");

        if (r.contains("status_code") && !r["status_code"].is_null()) {
            e.statusCode = r["status_code"].get<int>();
        }

        e.resultTag  = r.at("result_type").get<std::string>();
        e.resultType = resultTypeFromTag(e.resultTag);
        e.result     = r.at("result").get<std::string>();

        e.resultHeaders = stringList(r, "result_headers");
    } catch (const json::exception& ex) {
        throw ConfigParsingError(where + ": " + ex.what());
    }

    if (e.resultType == ResultType::Unknown) {
        std::cerr << "[Config] " << where << ": unknown result_type `" << e.resultTag
                  << "`, route will answer with an empty body\n";
    }

    return e;
}

ResolverMode modeFromString(const std::string& s) {
    std::string m = lower(s);
    if (m == "strict") return ResolverMode::Strict;
    if (m != "legacy") {
        std::cerr << "[Config] Invalid mode: " << s << ", fallback to 'legacy'\n";
    }
    return ResolverMode::Legacy;
}

Config::Config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigParsingError("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& ex) {
        throw ConfigParsingError(path + ": " + ex.what());
    }

    load(j);

    std::cout << "[Config] Loaded: host=" << host
              << ", port=" << port
              << ", threads=" << threads
              << ", mode=" << (mode == ResolverMode::Strict ? "strict" : "legacy")
              << ", routes=" << routes->size()
              << "\n";
}

Config Config::fromJson(const json& j) {
    Config cfg;
    cfg.load(j);
    return cfg;
}

void Config::load(const json& j) {
    if (!j.is_object()) {
        throw ConfigParsingError("top level must be an object");
    }

    long long maxLineLength = 8192, maxHeaderCount = 100, headerTimeoutMs = 10000;

    try {
        host          = j.value("host", std::string("0.0.0.0"));
        port          = j.value("port", 8080);
        threads       = j.value("threads", 4);
        mode          = modeFromString(j.value("mode", std::string("legacy")));
        idleTimeoutMs = j.value("idle_timeout_ms", 5000);
        accessLog     = j.value("access_log", std::string("data/logs/access_log.csv"));

        maxLineLength   = j.value("max_line_length", 8192LL);
        maxHeaderCount  = j.value("max_header_count", 100LL);
        headerTimeoutMs = j.value("header_timeout_ms", 10000LL);
    } catch (const json::exception& ex) {
        throw ConfigParsingError(ex.what());
    }

    if (port <= 0 || port > 65535) {
        throw ConfigParsingError("port out of range: " + std::to_string(port));
    }
    if (threads < 1) threads = 1;

    if (maxLineLength <= 0 || maxLineLength > kMaxLineLengthCap) {
        throw ConfigParsingError("max_line_length must be in 1.." + std::to_string(kMaxLineLengthCap));
    }
    if (maxHeaderCount <= 0 || maxHeaderCount > kMaxHeaderCountCap) {
        throw ConfigParsingError("max_header_count must be in 1.." + std::to_string(kMaxHeaderCountCap));
    }
    if (headerTimeoutMs < 0) {
        throw ConfigParsingError("header_timeout_ms must not be negative");
    }
    limits.maxLineLength  = static_cast<std::size_t>(maxLineLength);
    limits.maxHeaderCount = static_cast<std::size_t>(maxHeaderCount);
    limits.headerTimeout  = std::chrono::milliseconds(headerTimeoutMs);

    std::vector<RouteEntry> entries;
    if (j.contains("data")) {
        const json& data = j["data"];
        if (!data.is_array()) {
            throw ConfigParsingError("`data` must be an array of routes");
        }
        for (std::size_t i = 0; i < data.size(); ++i) {
            entries.push_back(parseRoute(data[i], i));
        }
    }

    routes = makeRouteTable(std::move(entries));
}
