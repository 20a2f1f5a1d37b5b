#include "utils/common.hpp"

#include <gtest/gtest.h>

#include "utils/logging.hpp"

using namespace stockade::utils;

TEST(Common, Base64)
{
    EXPECT_EQ(Base64Encode(""), "");
    EXPECT_EQ(Base64Encode("f"), "Zg==");
    EXPECT_EQ(Base64Encode("fo"), "Zm8=");
    EXPECT_EQ(Base64Encode("foo"), "Zm9v");
    EXPECT_EQ(Base64Encode(std::string("\x89PNG\0", 5)), "iVBORwA=");
}

TEST(Common, RandomHex)
{
    const auto id = RandomHex(16);
    EXPECT_EQ(id.size(), 16u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(RandomHex(16), id);
}

TEST(Logging, ParseLevel)
{
    EXPECT_EQ(ParseLogLevel("DEBUG", LogLevel::kInfo), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("Warning", LogLevel::kInfo), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error", LogLevel::kInfo), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("verbose", LogLevel::kInfo), LogLevel::kInfo);
}

TEST(Logging, MinLevelFilters)
{
    const auto saved = GetLogConfig();
    SetLogConfig(LogConfig{LogLevel::kError});

    testing::internal::CaptureStderr();
    LogWarn("test", "hidden");
    Log({LogLevel::kError, "test", "shown", {{"b", "2"}, {"a", "1"}}});
    const auto output = testing::internal::GetCapturedStderr();
    SetLogConfig(saved);

    EXPECT_EQ(output, "[test] ERROR shown a=1 b=2\n");
}
