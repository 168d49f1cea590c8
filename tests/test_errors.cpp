#include <gtest/gtest.h>
#include <string>
#include "errors.h"

TEST(ResultTest, Value) {
    auto res = Result<int>(42);
    EXPECT_TRUE(res.ok());
    EXPECT_TRUE(static_cast<bool>(res));
    EXPECT_EQ(res.value(), 42);
    EXPECT_THROW((void)res.error(), BadResultAccess);

    res.value() = 7;
    EXPECT_EQ(res.value(), 7);
}

TEST(ResultTest, Error) {
    Result<std::string> res = fail(ErrorCode::CycleDetected, "a -> b -> a");
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.code(), ErrorCode::CycleDetected);
    EXPECT_EQ(res.error().message, "a -> b -> a");
    EXPECT_THROW((void)res.value(), BadResultAccess);
    // BadResultAccess is a kind of std::bad_variant_access
    EXPECT_THROW((void)res.value(), std::bad_variant_access);
}

TEST(ResultTest, NoPayload) {
    auto res = Result<>();
    EXPECT_TRUE(res.ok());

    Result<> failed = fail(ErrorCode::InvalidInput, "empty");
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(toString(failed.error()), "InvalidInput: empty");
}

TEST(ResultTest, MoveOutValue) {
    auto res = Result<std::vector<int>>(std::vector<int>{1, 2, 3});
    auto moved = std::move(res).value();
    EXPECT_EQ(moved, (std::vector<int>{1, 2, 3}));
}

TEST(ErrorCodeTest, Names) {
    EXPECT_STREQ(toString(ErrorCode::DuplicateReferrer), "DuplicateReferrer");
    EXPECT_STREQ(toString(ErrorCode::InvalidProbabilityFunction), "InvalidProbabilityFunction");
    EXPECT_STREQ(toString(ErrorCode::InvalidSignature), "InvalidSignature");
}
