#include <gtest/gtest.h>

#include <fmt/format.h>
#include <system_error>

#include "infra/error_handler/error.hpp"

using namespace bucketcp::infra;

TEST(ErrorTest, CategoriesFollowCodes)
{
    EXPECT_EQ(make_error(ErrorCode::InvalidPattern, "").category(), ErrorCategory::Configuration);
    EXPECT_EQ(make_error(ErrorCode::InvalidDestination, "").category(), ErrorCategory::Configuration);
    EXPECT_EQ(make_error(ErrorCode::ListingFailed, "").category(), ErrorCategory::Enumeration);
    EXPECT_EQ(make_error(ErrorCode::WalkFailed, "").category(), ErrorCategory::Enumeration);
    EXPECT_EQ(make_error(ErrorCode::NetworkError, "").category(), ErrorCategory::Task);
    EXPECT_EQ(make_error(ErrorCode::UnsafeKey, "").category(), ErrorCategory::Task);
    EXPECT_EQ(make_error(ErrorCode::DestinationConflict, "").category(), ErrorCategory::Task);
    EXPECT_EQ(make_error(ErrorCode::Cancelled, "").category(), ErrorCategory::Cancelled);
}

TEST(ErrorTest, OnlyBatchLevelErrorsAreFatal)
{
    EXPECT_TRUE(make_error(ErrorCode::InvalidConfig, "").is_fatal());
    EXPECT_TRUE(make_error(ErrorCode::StatFailed, "").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::ReadFailed, "").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::Cancelled, "").is_fatal());
}

TEST(ErrorTest, ExitCodes)
{
    EXPECT_EQ(make_error(ErrorCode::InvalidPattern, "").to_exit_code(), 2);
    EXPECT_EQ(make_error(ErrorCode::ListingFailed, "").to_exit_code(), 3);
    EXPECT_EQ(make_error(ErrorCode::Cancelled, "").to_exit_code(), 130);
    EXPECT_EQ(make_error(ErrorCode::WriteFailed, "").to_exit_code(), 1);
}

TEST(ErrorTest, MapsFilesystemErrors)
{
    auto missing = make_error(std::make_error_code(std::errc::no_such_file_or_directory), "open a.txt");
    EXPECT_EQ(missing.code, ErrorCode::FileNotFound);
    EXPECT_TRUE(missing.message.starts_with("open a.txt: "));

    auto denied = make_error(std::make_error_code(std::errc::permission_denied), "open b.txt");
    EXPECT_EQ(denied.code, ErrorCode::PermissionDenied);

    auto other = make_error(std::make_error_code(std::errc::invalid_argument), "open c.txt");
    EXPECT_EQ(other.code, ErrorCode::Unknown);
}

TEST(ErrorTest, CapturesCallSite)
{
    const auto line = __LINE__ + 1;
    auto err = make_error(ErrorCode::Unknown, "here");
    EXPECT_EQ(err.line, static_cast<int>(line));
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
    EXPECT_STREQ(err.what(), "here");
}

TEST(ErrorTest, FormatsCodeName)
{
    EXPECT_EQ(fmt::format("{}", ErrorCode::ListingFailed), "listing failed");
    EXPECT_EQ(to_string(ErrorCode::Unknown), "unknown");
}

TEST(ErrorTest, LogAndReturnKeepsError)
{
    auto err = log_and_return(make_error(ErrorCode::UnsafeKey, "../evil"));
    EXPECT_EQ(err.code, ErrorCode::UnsafeKey);
    EXPECT_EQ(err.message, "../evil");
}
