//
// Created by gregorian-rayne on 10/14/26.
//

#include "gk/result.hpp"
#include "gk/error.hpp"

#include <gtest/gtest.h>
#include <string>

namespace gk
{
    TEST(ResultTest, SuccessConstruction) {
        auto result = Result<int, Error>::success(42);

        EXPECT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_TRUE(static_cast<bool>(result));
        EXPECT_EQ(result.value(), 42);
    }

    TEST(ResultTest, FailureConstruction) {
        auto result = Result<int, Error>::failure(Error::parse_error("bad hunk"));

        EXPECT_TRUE(result.is_err());
        EXPECT_FALSE(static_cast<bool>(result));
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST(ResultTest, WrongAccessorThrows) {
        auto failure = Result<int, Error>::failure(Error::invalid_argument("bad arg"));
        auto success = Result<int, Error>::success(10);

        EXPECT_THROW((void)failure.value(), std::logic_error);
        EXPECT_THROW((void)success.error(), std::logic_error);
    }

    TEST(ResultTest, ValueOr) {
        const auto success = Result<int, Error>::success(42);
        const auto failure = Result<int, Error>::failure(Error::config_error("oops"));

        EXPECT_EQ(success.value_or(0), 42);
        EXPECT_EQ(failure.value_or(0), 0);
    }

    TEST(ResultTest, Map) {
        const auto ok = Result<int, Error>::success(10);
        const auto err = Result<int, Error>::failure(Error::parse_error("invalid"));

        auto doubled = ok.map([](const int x) { return x * 2; });
        ASSERT_TRUE(doubled.is_ok());
        EXPECT_EQ(doubled.value(), 20);

        auto kept = err.map([](const int x) { return x * 2; });
        ASSERT_TRUE(kept.is_err());
        EXPECT_EQ(kept.error().code(), ErrorCode::ParseError);
    }

    TEST(ResultTest, AndThen) {
        const auto ok = Result<int, Error>::success(10);
        auto chained = ok.and_then([](const int x) {
            return Result<std::string, Error>::success(std::to_string(x));
        });
        ASSERT_TRUE(chained.is_ok());
        EXPECT_EQ(chained.value(), "10");

        auto failed = ok.and_then([](int) {
            return Result<std::string, Error>::failure(Error::config_error("rejected"));
        });
        ASSERT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().code(), ErrorCode::ConfigError);
    }

    TEST(ResultTest, AndThenOnRvalueMovesValue) {
        auto chained = Result<std::string, Error>::success("payload").and_then([](std::string&& text) {
            return Result<std::size_t, Error>::success(text.size());
        });

        ASSERT_TRUE(chained.is_ok());
        EXPECT_EQ(chained.value(), 7u);
    }

    TEST(ResultTest, MoveOutValue) {
        auto result = Result<std::string, Error>::success("moved");
        const std::string value = std::move(result).value();

        EXPECT_EQ(value, "moved");
    }

    TEST(ResultTest, VoidResult) {
        const auto ok = Result<void, Error>::success();
        const auto err = Result<void, Error>::failure(Error::io_error("write failed", "out.md"));

        EXPECT_TRUE(ok.is_ok());
        EXPECT_THROW((void)ok.error(), std::logic_error);
        ASSERT_TRUE(err.is_err());
        EXPECT_EQ(err.error().code(), ErrorCode::IoError);
    }
}  // namespace gk
