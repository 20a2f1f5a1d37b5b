#pragma once

#include <string>
#include <vector>

#include "sandbox/ui_action.hpp"

namespace stockade::sandbox {

// Translates a UI action into the argv of an input-injection command run
// inside the desktop container (xdotool, or sleep for waits). Pure: the same
// action always yields the same argv. Screenshots map to the no-op "true";
// capture is a separate primitive.
std::vector<std::string> BuildInputCommand(const UIAction& action);

}  // namespace stockade::sandbox
