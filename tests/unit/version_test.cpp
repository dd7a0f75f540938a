#include <gtest/gtest.h>

#include <string>

#include "elemcore/elemcore.hpp"

using elemcore::foundation::EngineError;
using elemcore::foundation::EngineResult;
using elemcore::foundation::ErrorCode;

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(elemcore::Version::major, 0);
    EXPECT_EQ(elemcore::Version::minor, 3);
    EXPECT_EQ(elemcore::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(elemcore::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = EngineResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = EngineResult<int>::err(EngineError(ErrorCode::InvalidArgument, "something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message(), "something failed");
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(ResultTest, ValueOr) {
    auto ok = EngineResult<float>::ok(0.5f);
    auto err = EngineResult<float>::err(EngineError(ErrorCode::Unknown));
    EXPECT_FLOAT_EQ(ok.valueOr(1.0f), 0.5f);
    EXPECT_FLOAT_EQ(err.valueOr(1.0f), 1.0f);
}

TEST(ResultTest, BoolConversion) {
    auto ok = EngineResult<int>::ok(1);
    auto err = EngineResult<int>::err(EngineError(ErrorCode::Unknown));
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, SameValueAndErrorType) {
    auto ok = elemcore::Result<std::string, std::string>::ok("value");
    auto err = elemcore::Result<std::string, std::string>::err("reason");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "reason");
}

TEST(ResultVoidTest, Ok) {
    auto result = EngineResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = EngineResult<void>::err(EngineError(ErrorCode::ConfigInvalidValue, "void error"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message(), "void error");
    EXPECT_EQ(result.error().subsystem(), "Config");
}
