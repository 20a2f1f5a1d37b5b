#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/ui_action.hpp"

namespace stockade::sandbox {

// Exit code reserved for "did not complete normally". Engines report
// program statuses in 0..255, so it never collides with a real one.
constexpr int kAbnormalExit = -1;

// Attribution for a result that did not succeed.
enum class FailureKind {
    kNone,
    kEmptyInput,
    kTimeout,
    kRuntimeFailure,
    kExecutionFailure,
    kCommandFailed,
    kDisplayNotReady
};

const char* ToString(FailureKind kind);

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = kAbnormalExit;
    double duration_ms = 0.0;
    bool timed_out = false;
    // The engine cut the captured output off at its response size cap.
    bool output_truncated = false;
    // Infrastructure fault description; empty when the program ran.
    std::string error;
    FailureKind failure = FailureKind::kRuntimeFailure;
};

// Output of one command run inside a running container.
struct ExecOutput {
    int exit_code = kAbnormalExit;
    std::string stdout_text;
    std::string stderr_text;
    bool truncated = false;
};

// Outcome of one UI action. success reflects only the exit status of the
// injected command; empty screenshots mean "unavailable".
struct UIActionResult {
    UIAction action;
    bool success = false;
    std::string screenshot_before;
    std::string screenshot_after;
    std::string error;
    double duration_ms = 0.0;
    FailureKind failure = FailureKind::kNone;
};

struct GuiState {
    std::string screenshot;
    int screen_width = 1280;
    int screen_height = 720;
    std::string display = ":99";
};

nlohmann::json ToJson(const ExecutionResult& result);

// Screenshots are base64-encoded unless include_screenshots is false, in
// which case only their byte sizes are reported.
nlohmann::json ToJson(const UIActionResult& result, bool include_screenshots = true);
nlohmann::json ToJson(const GuiState& state);

}  // namespace stockade::sandbox
