#include <gtest/gtest.h>

#include "core/Response.hpp"

TEST(ResponseTest, BuildWritesStatusLineHeadersAndBody) {
    Response res(Status::created(), "{\"id\":1}");
    res.headers["Content-Length"] = "8";
    res.headers["Content-Type"] = "application/json";

    std::string raw = res.build();

    EXPECT_EQ(raw.rfind("HTTP/1.1 201 Created\r\n", 0), 0u);
    EXPECT_NE(raw.find("\r\nContent-Length: 8\r\n"), std::string::npos);
    EXPECT_NE(raw.find("\r\nContent-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(raw.find("\r\nConnection: close\r\n"), std::string::npos);

    auto sep = raw.find("\r\n\r\n");
    ASSERT_NE(sep, std::string::npos);
    EXPECT_EQ(raw.substr(sep + 4), "{\"id\":1}");
}

TEST(ResponseTest, BuildAddsContentLengthWhenMissing) {
    Response res(Status::notFound(), "Path not found");

    std::string raw = res.build();

    EXPECT_EQ(raw.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_NE(raw.find("Content-Length: 14\r\n"), std::string::npos);
}

TEST(ResponseTest, BuildKeepsExplicitContentLengthOnly) {
    Response res(Status::ok(), "abc");
    res.headers["Content-Length"] = "3";

    std::string raw = res.build();

    auto first = raw.find("Content-Length");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(raw.find("Content-Length", first + 1), std::string::npos);
}

TEST(ResponseTest, BinaryBodySurvivesBuild) {
    std::string bytes("\x00\x01\x02\xFF", 4);
    Response res(Status::ok(), bytes);

    std::string raw = res.build();

    EXPECT_EQ(raw.substr(raw.size() - 4), bytes);
}
