#include "core/Result.h"
#include "core/SandboxError.h"
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <string>

using namespace BouncePit;

TEST(ResultTest, DefaultConstructorCreatesErrorState)
{
    spdlog::info("Starting ResultTest::DefaultConstructorCreatesErrorState test");
    Result<int, std::string> result;
    EXPECT_FALSE(result.isValue());
    EXPECT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue(), std::string());
}

TEST(ResultTest, SuccessWithDefaultValue)
{
    spdlog::info("Starting ResultTest::SuccessWithDefaultValue test");
    Result<int, std::string> result = Result<int, std::string>::okay();
    EXPECT_TRUE(result.isValue());
    EXPECT_FALSE(result.isError());
    EXPECT_EQ(result.value(), 0);
}

TEST(ResultTest, SuccessWithSpecificValue)
{
    spdlog::info("Starting ResultTest::SuccessWithSpecificValue test");
    Result<int, std::string> result = Result<int, std::string>::okay(42);
    EXPECT_TRUE(result.isValue());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(result.valueOr(7), 42);
}

TEST(ResultTest, ErrorWithSpecificValue)
{
    spdlog::info("Starting ResultTest::ErrorWithSpecificValue test");
    Result<int, std::string> result = Result<int, std::string>::error("Test error");
    EXPECT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue(), "Test error");
    EXPECT_EQ(result.valueOr(7), 7);
}

TEST(ResultTest, ImplicitConversionsFromValueAndError)
{
    spdlog::info("Starting ResultTest::ImplicitConversionsFromValueAndError test");
    auto parse = [](int input) -> Result<int, SandboxError> {
        if (input < 0) {
            return SandboxError::invalidArgument("negative");
        }
        return input * 2;
    };

    auto good = parse(4);
    ASSERT_TRUE(good.isValue());
    EXPECT_EQ(good.value(), 8);

    auto bad = parse(-1);
    ASSERT_TRUE(bad.isError());
    EXPECT_EQ(bad.errorValue().code, SandboxError::Code::InvalidArgument);
    EXPECT_EQ(bad.errorValue().message, "negative");
}

TEST(ResultTest, MonostateSuccess)
{
    spdlog::info("Starting ResultTest::MonostateSuccess test");
    Result<Okay, SandboxError> ok = Okay{};
    EXPECT_TRUE(ok.isValue());

    Result<Okay, SandboxError> stale = SandboxError::staleHandle("gone");
    ASSERT_TRUE(stale.isError());
    EXPECT_EQ(stale.errorValue().code, SandboxError::Code::StaleHandle);
}

TEST(ResultTest, ErrorCodeNames)
{
    spdlog::info("Starting ResultTest::ErrorCodeNames test");
    EXPECT_STREQ(getErrorCodeName(SandboxError::Code::InvalidArgument), "InvalidArgument");
    EXPECT_STREQ(getErrorCodeName(SandboxError::Code::StaleHandle), "StaleHandle");
    EXPECT_STREQ(getErrorCodeName(SandboxError::Code::ConfigFile), "ConfigFile");
}
