#include "sandbox/ui_action.hpp"

#include <gtest/gtest.h>

using namespace stockade::sandbox;

TEST(UiAction, ParseClick)
{
    const auto action = ParseUiAction({{"type", "click"}, {"x", 10}, {"y", 20}, {"description", "OK button"}});
    ASSERT_TRUE(std::holds_alternative<ClickAction>(action.kind));
    EXPECT_EQ(std::get<ClickAction>(action.kind).x, 10);
    EXPECT_EQ(std::get<ClickAction>(action.kind).y, 20);
    EXPECT_EQ(action.description, "OK button");
    EXPECT_STREQ(ActionName(action), "click");
}

TEST(UiAction, Defaults)
{
    const auto wait = ParseUiAction({{"type", "wait"}, {"duration_ms", 0}});
    EXPECT_EQ(std::get<WaitAction>(wait.kind).duration_ms, 500);

    const auto key = ParseUiAction({{"type", "key"}});
    EXPECT_EQ(std::get<KeyAction>(key.kind).key, "Return");

    const auto scroll = ParseUiAction({{"type", "scroll"}});
    EXPECT_EQ(std::get<ScrollAction>(scroll.kind).direction, ScrollDirection::kDown);
    EXPECT_EQ(std::get<ScrollAction>(scroll.kind).amount, 3);

    const auto untyped = ParseUiAction(nlohmann::json::object());
    EXPECT_TRUE(std::holds_alternative<ScreenshotAction>(untyped.kind));
}

TEST(UiAction, ParseScrollAndDrag)
{
    const auto scroll = ParseUiAction({{"type", "scroll"}, {"scroll_direction", "up"}, {"scroll_amount", 7}});
    EXPECT_EQ(std::get<ScrollAction>(scroll.kind).direction, ScrollDirection::kUp);
    EXPECT_EQ(std::get<ScrollAction>(scroll.kind).amount, 7);

    const auto drag = ParseUiAction({{"type", "drag"}, {"x", 1}, {"y", 2}, {"target_x", 3}, {"target_y", 4}});
    EXPECT_EQ(std::get<DragAction>(drag.kind).target_x, 3);
    EXPECT_EQ(std::get<DragAction>(drag.kind).target_y, 4);
}

TEST(UiAction, Rejects)
{
    EXPECT_THROW(ParseUiAction({{"type", "click"}, {"x", 1}}), std::invalid_argument);
    EXPECT_THROW(ParseUiAction({{"type", "click"}, {"x", "1"}, {"y", 2}}), std::invalid_argument);
    EXPECT_THROW(ParseUiAction({{"type", "teleport"}}), std::invalid_argument);
    EXPECT_THROW(ParseUiAction({{"type", "scroll"}, {"scroll_direction", "sideways"}}), std::invalid_argument);
    EXPECT_THROW(ParseUiAction(nlohmann::json::array()), std::invalid_argument);
}

TEST(UiAction, RejectsOutOfRangeIntegers)
{
    EXPECT_THROW(ParseUiAction({{"type", "click"}, {"x", 4294967396LL}, {"y", 2}}), std::invalid_argument);
    EXPECT_THROW(ParseUiAction({{"type", "move"}, {"x", 1}, {"y", -4294967296LL}}), std::invalid_argument);
    EXPECT_THROW(ParseUiAction({{"type", "drag"}, {"x", 1}, {"y", 2}, {"target_x", 3},
                                {"target_y", 18446744073709551615ULL}}), std::invalid_argument);
    EXPECT_THROW(ParseUiAction({{"type", "wait"}, {"duration_ms", 3000000000LL}}), std::invalid_argument);

    const auto edge = ParseUiAction({{"type", "click"}, {"x", 2147483647LL}, {"y", -2147483648LL}});
    EXPECT_EQ(std::get<ClickAction>(edge.kind).x, 2147483647);
    EXPECT_EQ(std::get<ClickAction>(edge.kind).y, -2147483647 - 1);
}

TEST(UiAction, ToJson)
{
    const UIAction type{TypeAction{"hello"}, "greet"};
    const auto json = ToJson(type);
    EXPECT_EQ(json["type"], "type");
    EXPECT_EQ(json["text"], "hello");
    EXPECT_EQ(json["description"], "greet");

    const auto parsed = ParseUiAction(ToJson(UIAction{ScrollAction{ScrollDirection::kLeft, 2}, {}}));
    EXPECT_EQ(std::get<ScrollAction>(parsed.kind).direction, ScrollDirection::kLeft);
}
