#include "sandbox/action_mapping.hpp"

#include <gtest/gtest.h>

using namespace stockade::sandbox;

using Argv = std::vector<std::string>;

namespace {

UIAction Make(UIActionKind kind) {
    return UIAction{std::move(kind), {}};
}

}  // namespace

TEST(ActionMapping, Click)
{
    EXPECT_EQ(BuildInputCommand(Make(ClickAction{10, 20})),
              (Argv{"xdotool", "mousemove", "--sync", "10", "20", "click", "1"}));
}

TEST(ActionMapping, DoubleAndRightClick)
{
    EXPECT_EQ(BuildInputCommand(Make(DoubleClickAction{5, 6})),
              (Argv{"xdotool", "mousemove", "--sync", "5", "6", "click", "--repeat", "2", "1"}));
    EXPECT_EQ(BuildInputCommand(Make(RightClickAction{5, 6})),
              (Argv{"xdotool", "mousemove", "--sync", "5", "6", "click", "3"}));
}

TEST(ActionMapping, MoveOnly)
{
    EXPECT_EQ(BuildInputCommand(Make(MoveAction{300, 400})),
              (Argv{"xdotool", "mousemove", "--sync", "300", "400"}));
}

TEST(ActionMapping, TypeIsLiteral)
{
    // "--" keeps a leading dash from being read as an option.
    EXPECT_EQ(BuildInputCommand(Make(TypeAction{"-rf hello"})),
              (Argv{"xdotool", "type", "--clearmodifiers", "--", "-rf hello"}));
}

TEST(ActionMapping, Key)
{
    EXPECT_EQ(BuildInputCommand(Make(KeyAction{"ctrl+c"})),
              (Argv{"xdotool", "key", "--clearmodifiers", "ctrl+c"}));
    EXPECT_EQ(BuildInputCommand(Make(KeyAction{})),
              (Argv{"xdotool", "key", "--clearmodifiers", "Return"}));
}

TEST(ActionMapping, ScrollButtons)
{
    EXPECT_EQ(BuildInputCommand(Make(ScrollAction{ScrollDirection::kUp, 2})),
              (Argv{"xdotool", "click", "--repeat", "2", "4"}));
    EXPECT_EQ(BuildInputCommand(Make(ScrollAction{ScrollDirection::kDown, 3})),
              (Argv{"xdotool", "click", "--repeat", "3", "5"}));
    EXPECT_EQ(BuildInputCommand(Make(ScrollAction{ScrollDirection::kLeft, 1})),
              (Argv{"xdotool", "click", "--repeat", "1", "6"}));
    EXPECT_EQ(BuildInputCommand(Make(ScrollAction{ScrollDirection::kRight, 0})),
              (Argv{"xdotool", "click", "--repeat", "1", "7"}));
}

TEST(ActionMapping, Drag)
{
    EXPECT_EQ(BuildInputCommand(Make(DragAction{1, 2, 30, 40})),
              (Argv{"xdotool", "mousemove", "--sync", "1", "2", "mousedown", "1",
                    "mousemove", "--sync", "30", "40", "mouseup", "1"}));
}

TEST(ActionMapping, Wait)
{
    EXPECT_EQ(BuildInputCommand(Make(WaitAction{500})), (Argv{"sleep", "0.5"}));
    EXPECT_EQ(BuildInputCommand(Make(WaitAction{1250})), (Argv{"sleep", "1.25"}));
    EXPECT_EQ(BuildInputCommand(Make(WaitAction{2000})), (Argv{"sleep", "2"}));
    EXPECT_EQ(BuildInputCommand(Make(WaitAction{0})), (Argv{"sleep", "0.5"}));
}

TEST(ActionMapping, ScreenshotIsNoOp)
{
    EXPECT_EQ(BuildInputCommand(Make(ScreenshotAction{})), (Argv{"true"}));
}

TEST(ActionMapping, Pure)
{
    const auto drag = Make(DragAction{7, 8, 9, 10});
    const auto first = BuildInputCommand(drag);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(BuildInputCommand(drag), first);
    }
}
