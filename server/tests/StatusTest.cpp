#include <gtest/gtest.h>

#include "core/HttpStatus.hpp"

TEST(StatusTest, KnownCodesMapToReasonPhrases) {
    EXPECT_EQ(Status::from(200).message, "OK");
    EXPECT_EQ(Status::from(201).message, "Created");
    EXPECT_EQ(Status::from(400).message, "Bad Request");
    EXPECT_EQ(Status::from(401).message, "Unauthorized");
    EXPECT_EQ(Status::from(402).message, "Payment Required");
    EXPECT_EQ(Status::from(403).message, "Forbidden");
    EXPECT_EQ(Status::from(404).message, "Not Found");
    EXPECT_EQ(Status::from(405).message, "Method Not Allowed");
    EXPECT_EQ(Status::from(406).message, "Not Acceptable");
    EXPECT_EQ(Status::from(422).message, "Unprocessable Entity");
    EXPECT_EQ(Status::from(500).message, "Internal Server Error");
    EXPECT_EQ(Status::from(422).code, 422);
}

TEST(StatusTest, UnknownCodesFallBackToOk) {
    for (int code : {0, 204, 301, 418, 503, -1}) {
        Status s = Status::from(code);
        EXPECT_EQ(s.code, 200) << code;
        EXPECT_EQ(s.message, "OK") << code;
    }
}
