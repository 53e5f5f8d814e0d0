#include <gtest/gtest.h>

#include <cerrno>
#include <string>
#include <system_error>

#include "infra/error_handler/error.hpp"

using grace::infra::ErrorCode;

TEST(Error, CapturesSourceLocation)
{
    const int line = __LINE__ + 1;
    auto err = grace::infra::make_error(ErrorCode::ResourceCloseFailure, "disk full");

    EXPECT_EQ(err.code, ErrorCode::ResourceCloseFailure);
    EXPECT_EQ(err.message, "disk full");
    EXPECT_STREQ(err.what(), "disk full");
    EXPECT_EQ(err.line, line);
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
}

TEST(Error, CloseFailureIsRecoverable)
{
    auto err = grace::infra::make_error(ErrorCode::ResourceCloseFailure, "x");
    EXPECT_FALSE(err.is_fatal());
    EXPECT_EQ(err.to_exit_code(), EXIT_FAILURE);
}

TEST(Error, SetupFailuresAreFatal)
{
    EXPECT_TRUE(grace::infra::make_error(ErrorCode::SignalSetupFailed, "x").is_fatal());
    EXPECT_TRUE(grace::infra::make_error(ErrorCode::SignalSourceBusy, "x").is_fatal());
    EXPECT_EQ(grace::infra::make_error(ErrorCode::ConfigParse, "x").to_exit_code(), 2);
    EXPECT_EQ(grace::infra::make_error(ErrorCode::InvalidArgument, "x").to_exit_code(), 64);
}

TEST(Error, SystemErrorCarriesErrnoText)
{
    auto err = grace::infra::make_system_error(ErrorCode::SignalSetupFailed, "pipe2",
                                               std::error_code(EMFILE, std::generic_category()));
    EXPECT_EQ(err.message.rfind("pipe2: ", 0), 0u);
    EXPECT_GT(err.message.size(), std::string("pipe2: ").size());
}

TEST(Error, LogAndReturnKeepsError)
{
    auto err = grace::infra::log_and_return(
        grace::infra::make_error(ErrorCode::ResourceOpenFailure, "cannot open"));
    EXPECT_EQ(err.code, ErrorCode::ResourceOpenFailure);
    EXPECT_EQ(err.message, "cannot open");
    EXPECT_EQ(grace::infra::to_string(err.code), "ResourceOpenFailure");
}
