// StreamHub - Real-time event fan-out server
// Tests for Result type and error codes

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "streamhub/core/result.hpp"
#include "streamhub/core/error_codes.hpp"

namespace streamhub {
namespace core {
namespace test {

TEST(ResultTest, SuccessHoldsValue) {
    auto result = Result<int, Error>::success(42);

    EXPECT_TRUE(result.isSuccess());
    EXPECT_FALSE(result.isError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorHoldsError) {
    auto result = Result<std::string, Error>::error(
        Error{ErrorCode::PoolFull, "Maximum total connections (3) reached", "acme"});

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::PoolFull);
    EXPECT_EQ(result.error().context, "acme");
}

// Same type on both sides must stay distinguishable
TEST(ResultTest, SameValueAndErrorType) {
    auto ok = Result<std::string, std::string>::success("conn_1");
    auto bad = Result<std::string, std::string>::error("rejected");

    EXPECT_TRUE(ok.isSuccess());
    EXPECT_EQ(ok.value(), "conn_1");
    EXPECT_TRUE(bad.isError());
    EXPECT_EQ(bad.error(), "rejected");
}

TEST(ResultTest, VoidSpecialization) {
    auto ok = Result<void, std::string>::success();
    auto bad = Result<void, std::string>::error("close failed");

    EXPECT_TRUE(ok.isSuccess());
    EXPECT_TRUE(bad.isError());
    EXPECT_EQ(bad.error(), "close failed");
    EXPECT_THROW((void)ok.error(), std::logic_error);
}

TEST(ResultTest, WrongAccessorThrows) {
    auto ok = Result<int, std::string>::success(1);
    auto bad = Result<int, std::string>::error("x");

    EXPECT_THROW((void)ok.error(), std::logic_error);
    EXPECT_THROW((void)bad.value(), std::logic_error);
}

TEST(ResultTest, MoveOutValue) {
    auto result = Result<std::string, int>::success("payload");
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "payload");
}

TEST(ResultTest, ValueOr) {
    EXPECT_EQ((Result<int, std::string>::success(7).valueOr(0)), 7);
    EXPECT_EQ((Result<int, std::string>::error("e").valueOr(0)), 0);
}

// =============================================================================
// Error Code Tests
// =============================================================================

TEST(ErrorCodeTest, CodesAreGroupedByRange) {
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::PoolFull), 100u);
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::UserConnectionLimitReached), 102u);
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::WriteFailed), 201u);
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::ConfigInvalid), 601u);
}

TEST(ErrorCodeTest, HumanReadableNames) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::TenantConnectionLimitReached),
                 "Tenant connection limit reached");
    EXPECT_STREQ(errorCodeToString(ErrorCode::PoolShutDown), "Pool shut down");
}

TEST(ErrorTest, ToStringIncludesMessageAndContext) {
    Error err{ErrorCode::WriteFailed, "Initial write failed", "conn_1"};
    EXPECT_EQ(err.toString(), "Write failed: Initial write failed [conn_1]");

    Error bare{ErrorCode::NotFound};
    EXPECT_EQ(bare.toString(), "Not found");
    EXPECT_FALSE(bare.isSuccess());
    EXPECT_TRUE(Error{ErrorCode::Success}.isSuccess());
}

} // namespace test
} // namespace core
} // namespace streamhub
