#include "sandbox/sandbox_types.hpp"

#include "utils/common.hpp"

namespace stockade::sandbox {

const char* ToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::kNone: return "none";
        case FailureKind::kEmptyInput: return "empty_input";
        case FailureKind::kTimeout: return "timeout";
        case FailureKind::kRuntimeFailure: return "runtime_failure";
        case FailureKind::kExecutionFailure: return "execution_failure";
        case FailureKind::kCommandFailed: return "command_failed";
        case FailureKind::kDisplayNotReady: return "display_not_ready";
    }
    return "unknown";
}

nlohmann::json ToJson(const ExecutionResult& result) {
    return {
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"exit_code", result.exit_code},
        {"duration_ms", result.duration_ms},
        {"timed_out", result.timed_out},
        {"output_truncated", result.output_truncated},
        {"error", result.error.empty() ? nlohmann::json(nullptr) : nlohmann::json(result.error)},
        {"failure", ToString(result.failure)}
    };
}

nlohmann::json ToJson(const UIActionResult& result, bool include_screenshots) {
    nlohmann::json json = {
        {"action", ToJson(result.action)},
        {"success", result.success},
        {"error", result.error},
        {"duration_ms", result.duration_ms},
        {"failure", ToString(result.failure)}
    };
    if (include_screenshots) {
        json["screenshot_before_b64"] = utils::Base64Encode(result.screenshot_before);
        json["screenshot_after_b64"] = utils::Base64Encode(result.screenshot_after);
    } else {
        json["screenshot_before_bytes"] = result.screenshot_before.size();
        json["screenshot_after_bytes"] = result.screenshot_after.size();
    }
    return json;
}

nlohmann::json ToJson(const GuiState& state) {
    return {
        {"screenshot_b64", utils::Base64Encode(state.screenshot)},
        {"screen_width", state.screen_width},
        {"screen_height", state.screen_height},
        {"display", state.display}
    };
}

}  // namespace stockade::sandbox
