#include "sandbox/ui_action.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace stockade::sandbox {
namespace {

// Rejects JSON integers that do not fit in an int instead of wrapping them.
int ToInt(const nlohmann::json& field, const char* key, const std::string& type) {
    const bool in_range = field.is_number_unsigned()
        ? field.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : field.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
          field.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw std::invalid_argument("action '" + type + "' field '" + key + "' is out of range");
    }
    return static_cast<int>(field.get<std::int64_t>());
}

int RequireInt(const nlohmann::json& json, const char* key, const std::string& type) {
    if (!json.contains(key) || !json[key].is_number_integer()) {
        throw std::invalid_argument("action '" + type + "' requires integer field '" + key + "'");
    }
    return ToInt(json[key], key, type);
}

ScrollDirection ParseScrollDirection(const std::string& value) {
    if (value == "up") {
        return ScrollDirection::kUp;
    }
    if (value == "down" || value.empty()) {
        return ScrollDirection::kDown;
    }
    if (value == "left") {
        return ScrollDirection::kLeft;
    }
    if (value == "right") {
        return ScrollDirection::kRight;
    }
    throw std::invalid_argument("unknown scroll direction '" + value + "'");
}

}  // namespace

const char* ActionName(const UIAction& action) {
    return std::visit(Overloaded{
        [](const ScreenshotAction&) { return "screenshot"; },
        [](const ClickAction&) { return "click"; },
        [](const DoubleClickAction&) { return "double_click"; },
        [](const RightClickAction&) { return "right_click"; },
        [](const TypeAction&) { return "type"; },
        [](const KeyAction&) { return "key"; },
        [](const ScrollAction&) { return "scroll"; },
        [](const MoveAction&) { return "move"; },
        [](const DragAction&) { return "drag"; },
        [](const WaitAction&) { return "wait"; },
    }, action.kind);
}

const char* ToString(ScrollDirection direction) {
    switch (direction) {
        case ScrollDirection::kUp: return "up";
        case ScrollDirection::kDown: return "down";
        case ScrollDirection::kLeft: return "left";
        case ScrollDirection::kRight: return "right";
    }
    return "down";
}

UIAction ParseUiAction(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("action must be a JSON object");
    }
    const std::string type = json.value("type", "screenshot");

    UIAction action{};
    action.description = json.contains("description") && json["description"].is_string()
        ? json["description"].get<std::string>()
        : std::string();

    if (type == "screenshot") {
        action.kind = ScreenshotAction{};
    } else if (type == "click") {
        action.kind = ClickAction{RequireInt(json, "x", type), RequireInt(json, "y", type)};
    } else if (type == "double_click") {
        action.kind = DoubleClickAction{RequireInt(json, "x", type), RequireInt(json, "y", type)};
    } else if (type == "right_click") {
        action.kind = RightClickAction{RequireInt(json, "x", type), RequireInt(json, "y", type)};
    } else if (type == "move") {
        action.kind = MoveAction{RequireInt(json, "x", type), RequireInt(json, "y", type)};
    } else if (type == "type") {
        TypeAction typed{};
        if (json.contains("text") && json["text"].is_string()) {
            typed.text = json["text"].get<std::string>();
        }
        action.kind = typed;
    } else if (type == "key") {
        KeyAction key{};
        if (json.contains("key") && json["key"].is_string() && !json["key"].get<std::string>().empty()) {
            key.key = json["key"].get<std::string>();
        }
        action.kind = key;
    } else if (type == "scroll") {
        ScrollAction scroll{};
        if (json.contains("scroll_direction") && json["scroll_direction"].is_string()) {
            scroll.direction = ParseScrollDirection(json["scroll_direction"].get<std::string>());
        }
        if (json.contains("scroll_amount") && json["scroll_amount"].is_number_integer()) {
            scroll.amount = std::max(1, ToInt(json["scroll_amount"], "scroll_amount", type));
        }
        action.kind = scroll;
    } else if (type == "drag") {
        action.kind = DragAction{
            RequireInt(json, "x", type),
            RequireInt(json, "y", type),
            RequireInt(json, "target_x", type),
            RequireInt(json, "target_y", type)};
    } else if (type == "wait") {
        WaitAction wait{};
        if (json.contains("duration_ms") && json["duration_ms"].is_number_integer()) {
            const auto duration = ToInt(json["duration_ms"], "duration_ms", type);
            wait.duration_ms = duration > 0 ? duration : 500;
        }
        action.kind = wait;
    } else {
        throw std::invalid_argument("unknown action type '" + type + "'");
    }
    return action;
}

nlohmann::json ToJson(const UIAction& action) {
    nlohmann::json json = {{"type", ActionName(action)}};
    std::visit(Overloaded{
        [](const ScreenshotAction&) {},
        [&json](const ClickAction& a) { json["x"] = a.x; json["y"] = a.y; },
        [&json](const DoubleClickAction& a) { json["x"] = a.x; json["y"] = a.y; },
        [&json](const RightClickAction& a) { json["x"] = a.x; json["y"] = a.y; },
        [&json](const TypeAction& a) { json["text"] = a.text; },
        [&json](const KeyAction& a) { json["key"] = a.key; },
        [&json](const ScrollAction& a) {
            json["scroll_direction"] = ToString(a.direction);
            json["scroll_amount"] = a.amount;
        },
        [&json](const MoveAction& a) { json["x"] = a.x; json["y"] = a.y; },
        [&json](const DragAction& a) {
            json["x"] = a.x;
            json["y"] = a.y;
            json["target_x"] = a.target_x;
            json["target_y"] = a.target_y;
        },
        [&json](const WaitAction& a) { json["duration_ms"] = a.duration_ms; },
    }, action.kind);
    if (!action.description.empty()) {
        json["description"] = action.description;
    }
    return json;
}

}  // namespace stockade::sandbox
