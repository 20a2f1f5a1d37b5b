#include "sandbox/ui_executor.hpp"

#include <algorithm>
#include <thread>

#include "sandbox/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace stockade::sandbox {
namespace {

constexpr const char* kTag = "ui";
constexpr const char* kScriptDir = "/tmp";
constexpr const char* kScriptName = "stockade_task.py";
// timeout(1) exits with 128 + SIGKILL when it had to kill the script.
constexpr int kKilledByTimeout = 137;
// Slack on the engine deadline so timeout(1) fires first.
constexpr std::chrono::seconds kExecGrace{5};

}  // namespace

const char* ToString(ExecutorState state) {
    switch (state) {
        case ExecutorState::kStopped: return "stopped";
        case ExecutorState::kStarting: return "starting";
        case ExecutorState::kReady: return "ready";
        case ExecutorState::kActing: return "acting";
        case ExecutorState::kStopping: return "stopping";
    }
    return "unknown";
}

UIExecutor::UIExecutor(std::shared_ptr<ContainerEngine> engine,
                       std::string image,
                       SecurityPolicy policy,
                       Options options)
    : runtime_(std::move(engine), std::move(image), std::move(policy), options.runtime)
    , options_(std::move(options)) {}

UIExecutor::UIExecutor(std::shared_ptr<ContainerEngine> engine,
                       std::string image,
                       SecurityPolicy policy)
    : UIExecutor(std::move(engine), std::move(image), std::move(policy), Options{}) {}

UIExecutor::~UIExecutor() {
    Stop();
}

bool UIExecutor::Start() {
    if (state_ != ExecutorState::kStopped) {
        return true;
    }
    state_ = ExecutorState::kStarting;
    display_ready_ = false;
    startup_error_.clear();
    runtime_.VerifyImage();

    const std::map<std::string, std::string> env = {
        {"DISPLAY", options_.display},
        {"SCREEN_WIDTH", std::to_string(options_.screen_width)},
        {"SCREEN_HEIGHT", std::to_string(options_.screen_height)},
        {"SCREEN_DEPTH", std::to_string(options_.screen_depth)},
        {"STOCKADE_VNC_ENABLED", options_.vnc_enabled ? "1" : "0"},
        {"VNC_PORT", std::to_string(options_.vnc_port)},
    };

    try {
        // No command: the image's entrypoint idles and waits for exec calls.
        handle_ = runtime_.CreateContainer({}, {}, env);
        runtime_.Start(handle_);
    } catch (const std::exception& ex) {
        startup_error_ = std::string("desktop container failed to start: ") + ex.what();
        utils::LogError(kTag, startup_error_);
        runtime_.Destroy(handle_);
        handle_ = ContainerHandle{};
        state_ = ExecutorState::kStopped;
        return false;
    }

    display_ready_ = WaitForDisplay();
    state_ = ExecutorState::kReady;
    utils::Log({utils::LogLevel::kInfo, kTag, "desktop started",
                {{"id", handle_.ShortId()},
                 {"display", options_.display},
                 {"ready", display_ready_ ? "true" : "false"}}});
    return true;
}

ExecOutput UIExecutor::ProbeDisplay(std::chrono::milliseconds timeout) {
    return runtime_.ExecCommand(handle_, {"xdpyinfo", "-display", options_.display},
                                {{"DISPLAY", options_.display}}, {},
                                std::min(timeout, options_.runtime.exec_timeout));
}

bool UIExecutor::WaitForDisplay() {
    const auto deadline = std::chrono::steady_clock::now() + options_.ready_timeout;
    ExecOutput probe{};
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        probe = ProbeDisplay(std::max(remaining, options_.ready_poll));
        if (probe.exit_code == 0) {
            return true;
        }
        if (std::chrono::steady_clock::now() + options_.ready_poll > deadline) {
            break;
        }
        std::this_thread::sleep_for(options_.ready_poll);
    }
    startup_error_ = "display " + options_.display + " not ready after " +
        std::to_string(options_.ready_timeout.count()) + "ms";
    if (!probe.stderr_text.empty()) {
        startup_error_ += ": " + probe.stderr_text;
    }
    utils::LogWarn(kTag, startup_error_);
    return false;
}

void UIExecutor::Stop() {
    if (state_ == ExecutorState::kStopped && handle_.id.empty()) {
        return;
    }
    state_ = ExecutorState::kStopping;
    if (!runtime_.Destroy(handle_)) {
        utils::LogError(kTag, "desktop container " + handle_.ShortId() + " may still exist");
    }
    handle_ = ContainerHandle{};
    display_ready_ = false;
    state_ = ExecutorState::kStopped;
}

void UIExecutor::RequireReady(const char* operation) const {
    if (state_ != ExecutorState::kReady) {
        throw NotRunningError(std::string(operation) + " requires a started UI executor (state " +
            ToString(state_) + ")");
    }
}

UIActionResult UIExecutor::Act(const UIAction& action) {
    RequireReady("act");
    state_ = ExecutorState::kActing;
    UIActionResult result{};
    try {
        result = runtime_.ExecuteUiAction(handle_, action, options_.display);
    } catch (...) {
        state_ = ExecutorState::kReady;
        throw;
    }
    state_ = ExecutorState::kReady;

    if (!display_ready_) {
        // The display may have come up after the readiness window.
        display_ready_ = result.success || ProbeDisplay(options_.ready_poll).exit_code == 0;
        if (display_ready_) {
            utils::LogInfo(kTag, "display " + options_.display + " is ready");
        }
    }
    if (!result.success && !display_ready_) {
        result.failure = FailureKind::kDisplayNotReady;
        result.error = startup_error_ + (result.error.empty() ? "" : "; " + result.error);
    }
    return result;
}

ExecOutput UIExecutor::ExecPython(const std::string& code) {
    RequireReady("exec_python");
    try {
        runtime_.CopyToContainer(handle_, kScriptDir, {TarEntry{kScriptName, code, 0644}});
    } catch (const NotRunningError&) {
        throw;
    } catch (const std::exception& ex) {
        ExecOutput output{};
        output.stderr_text = std::string("cannot copy script: ") + ex.what();
        utils::LogError(kTag, output.stderr_text);
        return output;
    }
    // The engine cannot stop an exec, so the limit is enforced inside the
    // container.
    const auto limit = std::chrono::duration_cast<std::chrono::seconds>(options_.runtime.exec_timeout);
    auto output = runtime_.ExecCommand(handle_,
                                       {"timeout", "-s", "KILL", std::to_string(limit.count()),
                                        "python3", std::string(kScriptDir) + "/" + kScriptName},
                                       {{"DISPLAY", options_.display}}, kScriptDir,
                                       options_.runtime.exec_timeout + kExecGrace);
    if (output.exit_code == kKilledByTimeout) {
        if (!output.stderr_text.empty() && output.stderr_text.back() != '\n') {
            output.stderr_text += '\n';
        }
        output.stderr_text += "script killed after " + std::to_string(limit.count()) + "s";
        utils::LogWarn(kTag, "exec_python killed after " + std::to_string(limit.count()) + "s");
    }
    return output;
}

std::string UIExecutor::Screenshot() {
    RequireReady("screenshot");
    return runtime_.TakeScreenshot(handle_, options_.display);
}

std::string UIExecutor::ScreenshotBase64() {
    return utils::Base64Encode(Screenshot());
}

GuiState UIExecutor::GetGuiState() {
    GuiState state{};
    state.screenshot = Screenshot();
    state.screen_width = options_.screen_width;
    state.screen_height = options_.screen_height;
    state.display = options_.display;
    return state;
}

UIExecutor::Options UiOptionsFromConfig(const config::UiSandboxConfig& ui) {
    UIExecutor::Options options{};
    options.display = ui.display;
    options.screen_width = ui.screen_width;
    options.screen_height = ui.screen_height;
    options.screen_depth = ui.screen_depth;
    options.vnc_enabled = ui.vnc_enabled;
    options.vnc_port = ui.vnc_port;
    options.ready_timeout = std::chrono::milliseconds(ui.ready_timeout_ms);
    options.ready_poll = std::chrono::milliseconds(ui.ready_poll_ms);
    options.runtime.settle_delay = std::chrono::milliseconds(ui.settle_delay_ms);
    options.runtime.exec_timeout = std::chrono::seconds(ui.timeout_s);
    return options;
}

std::unique_ptr<UIExecutor> CreateUiExecutor(const config::Config& config,
                                             std::shared_ptr<ContainerEngine> engine) {
    return std::make_unique<UIExecutor>(std::move(engine), config.ui_sandbox.image,
                                        UiPolicy(config.ui_sandbox), UiOptionsFromConfig(config.ui_sandbox));
}

}  // namespace stockade::sandbox
