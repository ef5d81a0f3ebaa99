#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "core/Errors.hpp"
#include "utils/Config.hpp"

using json = nlohmann::json;

TEST(ConfigTest, DefaultsWhenSettingsAreMissing) {
    Config cfg = Config::fromJson(json::object());

    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.threads, 4);
    EXPECT_EQ(cfg.mode, ResolverMode::Legacy);
    EXPECT_EQ(cfg.idleTimeoutMs, 5000);
    EXPECT_EQ(cfg.limits.maxLineLength, 8192u);
    EXPECT_EQ(cfg.limits.maxHeaderCount, 100u);
    ASSERT_TRUE(cfg.routes);
    EXPECT_TRUE(cfg.routes->empty());
}

TEST(ConfigTest, LoadsRoutesInOrder) {
    json j = json::parse(R"({
        "port": 9090,
        "threads": 2,
        "mode": "STRICT",
        "max_line_length": 1024,
        "data": [
            {"path": "/hello", "method": "GET", "result_type": "direct", "result": "hi"},
            {"path": "/users", "method": "POST", "headers": ["Authorization"],
             "queries": ["id"], "status_code": 201, "result_type": "dl",
             "result": "./files/report.pdf",
             "result_headers": ["X-A: 1", "X-B: 2"]},
            {"path": "/weird", "method": "PATCH", "result_type": "stream", "result": ""}
        ]
    })");

    Config cfg = Config::fromJson(j);

    EXPECT_EQ(cfg.port, 9090);
    EXPECT_EQ(cfg.threads, 2);
    EXPECT_EQ(cfg.mode, ResolverMode::Strict);
    EXPECT_EQ(cfg.limits.maxLineLength, 1024u);
    ASSERT_EQ(cfg.routes->size(), 3u);

    const RouteEntry& hello = (*cfg.routes)[0];
    EXPECT_EQ(hello.path, "/hello");
    EXPECT_TRUE(hello.method == Method::GET);
    EXPECT_EQ(hello.resultType, ResultType::Direct);
    EXPECT_FALSE(hello.headers.has_value());
    EXPECT_FALSE(hello.statusCode.has_value());
    EXPECT_FALSE(hello.resultHeaders.has_value());

    const RouteEntry& users = (*cfg.routes)[1];
    EXPECT_TRUE(users.method == Method::POST);
    ASSERT_TRUE(users.headers.has_value());
    EXPECT_EQ(users.headers->at(0), "Authorization");
    ASSERT_TRUE(users.queries.has_value());
    EXPECT_EQ(users.queries->at(0), "id");
    EXPECT_EQ(users.statusCode.value_or(0), 201);
    EXPECT_EQ(users.resultType, ResultType::Download);
    EXPECT_EQ(users.result, "./files/report.pdf");
    ASSERT_TRUE(users.resultHeaders.has_value());
    EXPECT_EQ(users.resultHeaders->size(), 2u);

    const RouteEntry& weird = (*cfg.routes)[2];
    EXPECT_EQ(weird.resultType, ResultType::Unknown);
    EXPECT_EQ(weird.resultTag, "stream");
}

TEST(ConfigTest, UnknownModeFallsBackToLegacy) {
    Config cfg = Config::fromJson(json::parse(R"({"mode": "lenient"})"));
    EXPECT_EQ(cfg.mode, ResolverMode::Legacy);
}

TEST(ConfigTest, RejectsMalformedRoutes) {
    // missing path
    EXPECT_THROW(Config::fromJson(json::parse(
        R"({"data": [{"method": "GET", "result_type": "direct", "result": "x"}]})")),
        ConfigParsingError);
    // unknown method
    EXPECT_THROW(Config::fromJson(json::parse(
        R"({"data": [{"path": "/", "method": "FETCH", "result_type": "direct", "result": "x"}]})")),
        ConfigParsingError);
    // headers not a string list
    EXPECT_THROW(Config::fromJson(json::parse(
        R"({"data": [{"path": "/", "method": "GET", "headers": [1],
                      "result_type": "direct", "result": "x"}]})")),
        ConfigParsingError);
    // data not an array
    EXPECT_THROW(Config::fromJson(json::parse(R"({"data": {}})")), ConfigParsingError);
    // port out of range
    EXPECT_THROW(Config::fromJson(json::parse(R"({"port": 70000})")), ConfigParsingError);
    // wrong scalar type
    EXPECT_THROW(Config::fromJson(json::parse(R"({"port": "eighty"})")), ConfigParsingError);
}

TEST(ConfigTest, RejectsOutOfRangeParserLimits) {
    EXPECT_THROW(Config::fromJson(json::parse(R"({"max_line_length": -1})")), ConfigParsingError);
    EXPECT_THROW(Config::fromJson(json::parse(R"({"max_line_length": 0})")), ConfigParsingError);
    EXPECT_THROW(Config::fromJson(json::parse(R"({"max_line_length": 18446744073709551615})")),
                 ConfigParsingError);
    EXPECT_THROW(Config::fromJson(json::parse(R"({"max_header_count": 0})")), ConfigParsingError);
    EXPECT_THROW(Config::fromJson(json::parse(R"({"max_header_count": -5})")), ConfigParsingError);
    EXPECT_THROW(Config::fromJson(json::parse(R"({"header_timeout_ms": -1})")), ConfigParsingError);
}

TEST(ConfigTest, ReadsHeaderTimeout) {
    Config defaults = Config::fromJson(json::object());
    EXPECT_EQ(defaults.limits.headerTimeout.count(), 10000);

    Config cfg = Config::fromJson(json::parse(R"({"header_timeout_ms": 250, "max_header_count": 7})"));
    EXPECT_EQ(cfg.limits.headerTimeout.count(), 250);
    EXPECT_EQ(cfg.limits.maxHeaderCount, 7u);
}

TEST(ConfigTest, ReadsFileFromDisk) {
    auto path = std::filesystem::temp_directory_path() / "fakerest_config_test.json";
    {
        std::ofstream f(path);
        f << R"({"port": 8181, "data": [{"path": "/p", "method": "DELETE",
                 "result_type": "direct", "result": "gone"}]})";
    }

    Config cfg(path.string());
    EXPECT_EQ(cfg.port, 8181);
    ASSERT_EQ(cfg.routes->size(), 1u);
    EXPECT_TRUE((*cfg.routes)[0].method == Method::DELETE);

    std::filesystem::remove(path);
}

TEST(ConfigTest, MissingOrInvalidFileThrows) {
    EXPECT_THROW(Config("/nonexistent/fakerest/config.json"), ConfigParsingError);

    auto path = std::filesystem::temp_directory_path() / "fakerest_config_bad.json";
    {
        std::ofstream f(path);
        f << "{ not json";
    }
    EXPECT_THROW(Config(path.string()), ConfigParsingError);
    std::filesystem::remove(path);
}

TEST(ConfigTest, SampleConfigLoads) {
    Config cfg("server/config/server.json");
    EXPECT_EQ(cfg.routes->size(), 4u);
    EXPECT_EQ((*cfg.routes)[3].resultType, ResultType::Download);
}
