#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/container_engine.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/sandbox_types.hpp"
#include "sandbox/security_policy.hpp"
#include "sandbox/ui_action.hpp"

namespace stockade::sandbox {

enum class ExecutorState {
    kStopped,
    kStarting,
    kReady,
    kActing,
    kStopping
};

const char* ToString(ExecutorState state);

// Owns one long-lived desktop container (virtual display, window manager,
// xdotool, scrot) and drives it through exec calls.
//
// Not thread-safe: every action depends on the display state the previous
// one left behind, so callers sharing an instance must serialize access.
class UIExecutor {
public:
    struct Options {
        std::string display = ":99";
        int screen_width = 1280;
        int screen_height = 720;
        int screen_depth = 24;
        bool vnc_enabled = false;
        int vnc_port = 5900;
        std::chrono::milliseconds ready_timeout{10000};
        std::chrono::milliseconds ready_poll{500};
        ContainerRuntime::Options runtime;
    };

    UIExecutor(std::shared_ptr<ContainerEngine> engine,
               std::string image,
               SecurityPolicy policy,
               Options options);
    UIExecutor(std::shared_ptr<ContainerEngine> engine,
               std::string image,
               SecurityPolicy policy);
    ~UIExecutor();

    UIExecutor(const UIExecutor&) = delete;
    UIExecutor& operator=(const UIExecutor&) = delete;

    // Creates and starts the desktop container, then polls the display until
    // it answers or ready_timeout passes. An unresponsive display is logged
    // and remembered but does not fail the call. Returns false only when no
    // container could be started; StartupError() says why.
    bool Start();

    // Destroys the container. No-op when never started.
    void Stop();

    // Throws NotRunningError before a successful Start().
    UIActionResult Act(const UIAction& action);

    // Copies code into the container as an in-memory archive and runs it
    // with python3 against the live display. The script is killed inside the
    // container once the exec timeout passes.
    ExecOutput ExecPython(const std::string& code);

    std::string Screenshot();
    std::string ScreenshotBase64();
    GuiState GetGuiState();

    ExecutorState state() const { return state_; }
    bool DisplayReady() const { return display_ready_; }
    const std::string& StartupError() const { return startup_error_; }
    const Options& options() const { return options_; }

private:
    ExecOutput ProbeDisplay(std::chrono::milliseconds timeout);
    bool WaitForDisplay();
    void RequireReady(const char* operation) const;

    ContainerRuntime runtime_;
    Options options_;
    ContainerHandle handle_;
    ExecutorState state_ = ExecutorState::kStopped;
    bool display_ready_ = false;
    std::string startup_error_;
};

// Pairs Start() and Stop() with a scope.
class UiSession {
public:
    explicit UiSession(UIExecutor& executor)
        : executor_(executor) {
        executor_.Start();
    }

    ~UiSession() {
        executor_.Stop();
    }

    UiSession(const UiSession&) = delete;
    UiSession& operator=(const UiSession&) = delete;

    UIExecutor& operator*() { return executor_; }
    UIExecutor* operator->() { return &executor_; }

private:
    UIExecutor& executor_;
};

UIExecutor::Options UiOptionsFromConfig(const config::UiSandboxConfig& ui);

// Relaxed-preset executor wired from the uiSandbox config section.
std::unique_ptr<UIExecutor> CreateUiExecutor(const config::Config& config,
                                             std::shared_ptr<ContainerEngine> engine);

}  // namespace stockade::sandbox
