#include <gtest/gtest.h>

#include <string>

#include "cas/core/result.hpp"
#include "cas/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(cas::Version::major, 0);
    EXPECT_EQ(cas::Version::minor, 3);
    EXPECT_EQ(cas::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(cas::Version::string, "0.3.0");
}

struct TestError {
    int code = -1;
    std::string message;
};

TEST(ResultTest, OkValue) {
    auto result = cas::Result<int, TestError>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = cas::Result<int, TestError>::err(TestError{404, "not found"});
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ValueOr) {
    auto ok = cas::Result<int, TestError>::ok(10);
    auto err = cas::Result<int, TestError>::err(TestError{});
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, SameTypeForValueAndError) {
    auto ok = cas::Result<std::string, std::string>::ok("value");
    auto err = cas::Result<std::string, std::string>::err("error");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), "value");
    ASSERT_FALSE(err);
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultTest, MoveOutValue) {
    auto result = cas::Result<std::string, TestError>::ok("payload");
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "payload");
}

TEST(ResultVoidTest, Ok) {
    auto result = cas::Result<void, TestError>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = cas::Result<void, TestError>::err(TestError{1, "void error"});
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}
