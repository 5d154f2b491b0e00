//
// Created by gregorian-rayne on 1/12/26.
//

#include "lpa/error.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace lpa
{
    TEST(ErrorTest, Factories) {
        EXPECT_EQ(Error::invalid_argument("x").code(), ErrorCode::InvalidArgument);
        EXPECT_EQ(Error::not_found("x").code(), ErrorCode::NotFound);
        EXPECT_EQ(Error::parse_error("x").code(), ErrorCode::ParseError);
        EXPECT_EQ(Error::io_error("x").code(), ErrorCode::IoError);
        EXPECT_EQ(Error::config_error("x").code(), ErrorCode::ConfigError);
        EXPECT_EQ(Error::cache_error("x").code(), ErrorCode::CacheError);
        EXPECT_EQ(Error::internal_error("x").code(), ErrorCode::InternalError);
    }

    TEST(ErrorTest, ContextIsOptional) {
        const auto plain = Error::config_error("threads must be >= 0");
        EXPECT_FALSE(plain.context().has_value());

        const auto located = Error::config_error("threads must be >= 0", "lpa.toml");
        ASSERT_TRUE(located.context().has_value());
        EXPECT_EQ(located.context().value(), "lpa.toml");
    }

    TEST(ErrorTest, WithContextAppends) {
        const auto error = Error::parse_error("unexpected token", "line 3").with_context("lpa.toml");

        EXPECT_EQ(error.context().value(), "line 3; lpa.toml");
        EXPECT_EQ(error.message(), "unexpected token");
        EXPECT_EQ(Error::io_error("unreadable").with_context("lpa.toml").context().value(), "lpa.toml");
    }

    TEST(ErrorTest, ToString) {
        EXPECT_EQ(Error::not_found("File not found").to_string(), "[NotFound] File not found");
        EXPECT_EQ(Error::io_error("Failed to open file", "a.php").to_string(),
                  "[IoError] Failed to open file (context: a.php)");
    }

    TEST(ErrorTest, StreamAndEquality) {
        std::ostringstream out;
        out << Error::cache_error("stale");

        EXPECT_EQ(out.str(), "[CacheError] stale");
        EXPECT_EQ(Error::cache_error("stale"), Error::cache_error("stale"));
        EXPECT_NE(Error::cache_error("stale"), Error::cache_error("stale", "dir"));
    }
}
