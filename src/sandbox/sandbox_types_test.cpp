#include "sandbox/sandbox_types.hpp"

#include <gtest/gtest.h>

using namespace stockade::sandbox;

TEST(SandboxTypes, ExecutionResultJson)
{
    ExecutionResult result{};
    result.stdout_text = "42\n";
    result.exit_code = 0;
    result.failure = FailureKind::kNone;
    const auto json = ToJson(result);
    EXPECT_EQ(json["stdout"], "42\n");
    EXPECT_EQ(json["exit_code"], 0);
    EXPECT_EQ(json["failure"], "none");
    EXPECT_TRUE(json["error"].is_null());
    EXPECT_EQ(json["timed_out"], false);
    EXPECT_EQ(json["output_truncated"], false);
}

TEST(SandboxTypes, DefaultResultIsAbnormal)
{
    const ExecutionResult result{};
    EXPECT_EQ(result.exit_code, kAbnormalExit);
    EXPECT_EQ(result.failure, FailureKind::kRuntimeFailure);
}

TEST(SandboxTypes, ActionResultScreenshots)
{
    UIActionResult result{};
    result.action = UIAction{ClickAction{1, 2}, {}};
    result.success = true;
    result.screenshot_before = "abc";

    const auto encoded = ToJson(result);
    EXPECT_EQ(encoded["screenshot_before_b64"], "YWJj");
    EXPECT_EQ(encoded["screenshot_after_b64"], "");
    EXPECT_EQ(encoded["action"]["type"], "click");

    const auto sizes = ToJson(result, false);
    EXPECT_EQ(sizes["screenshot_before_bytes"], 3);
    EXPECT_EQ(sizes["screenshot_after_bytes"], 0);
    EXPECT_FALSE(sizes.contains("screenshot_before_b64"));
}

TEST(SandboxTypes, FailureNames)
{
    EXPECT_STREQ(ToString(FailureKind::kTimeout), "timeout");
    EXPECT_STREQ(ToString(FailureKind::kDisplayNotReady), "display_not_ready");
    EXPECT_STREQ(ToString(FailureKind::kEmptyInput), "empty_input");
}
