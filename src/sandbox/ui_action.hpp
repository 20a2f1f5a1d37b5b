#pragma once

#include <string>
#include <variant>

#include "nlohmann/json.hpp"

namespace stockade::sandbox {

enum class ScrollDirection {
    kUp,
    kDown,
    kLeft,
    kRight
};

struct ScreenshotAction {};

struct ClickAction {
    int x = 0;
    int y = 0;
};

struct DoubleClickAction {
    int x = 0;
    int y = 0;
};

struct RightClickAction {
    int x = 0;
    int y = 0;
};

struct MoveAction {
    int x = 0;
    int y = 0;
};

struct TypeAction {
    std::string text;
};

// Named key or chord in xdotool syntax, e.g. "Return" or "ctrl+c".
struct KeyAction {
    std::string key = "Return";
};

struct ScrollAction {
    ScrollDirection direction = ScrollDirection::kDown;
    int amount = 3;
};

struct DragAction {
    int x = 0;
    int y = 0;
    int target_x = 0;
    int target_y = 0;
};

struct WaitAction {
    int duration_ms = 500;
};

using UIActionKind = std::variant<
    ScreenshotAction,
    ClickAction,
    DoubleClickAction,
    RightClickAction,
    TypeAction,
    KeyAction,
    ScrollAction,
    MoveAction,
    DragAction,
    WaitAction>;

struct UIAction {
    UIActionKind kind;
    std::string description;
};

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Wire name of the action's variant ("click", "scroll", ...).
const char* ActionName(const UIAction& action);

const char* ToString(ScrollDirection direction);

// Accepts {"type": "...", ...} objects as produced by a planner. Throws
// std::invalid_argument for unknown types or missing required fields.
UIAction ParseUiAction(const nlohmann::json& json);

nlohmann::json ToJson(const UIAction& action);

}  // namespace stockade::sandbox
