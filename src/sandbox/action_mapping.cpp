#include "sandbox/action_mapping.hpp"

#include <algorithm>

namespace stockade::sandbox {
namespace {

constexpr const char* kXdotool = "xdotool";

// X11 wheel buttons.
const char* WheelButton(ScrollDirection direction) {
    switch (direction) {
        case ScrollDirection::kUp: return "4";
        case ScrollDirection::kDown: return "5";
        case ScrollDirection::kLeft: return "6";
        case ScrollDirection::kRight: return "7";
    }
    return "5";
}

// 500 -> "0.5", 1250 -> "1.25", 2000 -> "2".
std::string FormatSeconds(int duration_ms) {
    std::string text = std::to_string(duration_ms / 1000);
    const int fraction = duration_ms % 1000;
    if (fraction == 0) {
        return text;
    }
    std::string digits = std::to_string(fraction);
    digits.insert(0, 3 - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') {
        digits.pop_back();
    }
    return text + "." + digits;
}

std::vector<std::string> MoveTo(int x, int y) {
    return {kXdotool, "mousemove", "--sync", std::to_string(x), std::to_string(y)};
}

std::vector<std::string> Append(std::vector<std::string> head, std::initializer_list<std::string> tail) {
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}

}  // namespace

std::vector<std::string> BuildInputCommand(const UIAction& action) {
    return std::visit(Overloaded{
        [](const ScreenshotAction&) -> std::vector<std::string> {
            return {"true"};
        },
        [](const ClickAction& a) {
            return Append(MoveTo(a.x, a.y), {"click", "1"});
        },
        [](const DoubleClickAction& a) {
            return Append(MoveTo(a.x, a.y), {"click", "--repeat", "2", "1"});
        },
        [](const RightClickAction& a) {
            return Append(MoveTo(a.x, a.y), {"click", "3"});
        },
        [](const MoveAction& a) {
            return MoveTo(a.x, a.y);
        },
        [](const TypeAction& a) -> std::vector<std::string> {
            return {kXdotool, "type", "--clearmodifiers", "--", a.text};
        },
        [](const KeyAction& a) -> std::vector<std::string> {
            return {kXdotool, "key", "--clearmodifiers", a.key.empty() ? std::string("Return") : a.key};
        },
        [](const ScrollAction& a) -> std::vector<std::string> {
            const int repeat = std::max(1, a.amount);
            return {kXdotool, "click", "--repeat", std::to_string(repeat), WheelButton(a.direction)};
        },
        [](const DragAction& a) {
            return std::vector<std::string>{
                kXdotool, "mousemove", "--sync", std::to_string(a.x), std::to_string(a.y),
                "mousedown", "1",
                "mousemove", "--sync", std::to_string(a.target_x), std::to_string(a.target_y),
                "mouseup", "1"};
        },
        [](const WaitAction& a) -> std::vector<std::string> {
            const int duration = a.duration_ms > 0 ? a.duration_ms : 500;
            return {"sleep", FormatSeconds(duration)};
        },
    }, action.kind);
}

}  // namespace stockade::sandbox
