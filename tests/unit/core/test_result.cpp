//
// Created by gregorian-rayne on 1/12/26.
//

#include "lpa/result.hpp"
#include "lpa/error.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace lpa
{
    TEST(ResultTest, Success) {
        auto result = Result<int, Error>::success(42);

        EXPECT_TRUE(result.is_ok());
        EXPECT_TRUE(static_cast<bool>(result));
        EXPECT_EQ(result.value(), 42);
        EXPECT_THROW(static_cast<void>(result.error()), std::logic_error);
    }

    TEST(ResultTest, Failure) {
        auto result = Result<int, Error>::failure(Error::not_found("model not found", "App\\Models\\Post"));

        EXPECT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
        EXPECT_THROW(static_cast<void>(result.value()), std::logic_error);
    }

    TEST(ResultTest, MoveOnlyValue) {
        auto result = Result<std::unique_ptr<int>, Error>::success(std::make_unique<int>(3));

        auto owned = std::move(result).value();
        ASSERT_NE(owned, nullptr);
        EXPECT_EQ(*owned, 3);
    }

    TEST(ResultTest, ErrorIsCopiedWithResult) {
        const auto failed = Result<std::string, Error>::failure(Error::parse_error("bad toml", "lpa.toml"));

        const auto copy = failed;

        ASSERT_TRUE(copy.is_err());
        EXPECT_EQ(copy.error(), failed.error());
        EXPECT_FALSE(static_cast<bool>(copy));
    }

    TEST(ResultTest, VoidResult) {
        const auto ok = Result<void, Error>::success();
        const auto err = Result<void, Error>::failure(Error::io_error("disk full"));

        EXPECT_TRUE(ok.is_ok());
        EXPECT_TRUE(err.is_err());
        EXPECT_EQ(err.error().code(), ErrorCode::IoError);
        EXPECT_THROW(static_cast<void>(ok.error()), std::logic_error);
    }
}
