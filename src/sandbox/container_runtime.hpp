#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/container_engine.hpp"
#include "sandbox/sandbox_types.hpp"
#include "sandbox/security_policy.hpp"
#include "sandbox/tar_stream.hpp"
#include "sandbox/ui_action.hpp"

namespace stockade::sandbox {

enum class ContainerState {
    kCreated,
    kRunning,
    kExited,
    kKilled,
    kDestroyed
};

const char* ToString(ContainerState state);

struct ContainerHandle {
    std::string id;
    ContainerState state = ContainerState::kCreated;
    // Set when Wait() gave up because the engine failed rather than because
    // the deadline passed.
    std::string error;

    std::string ShortId() const { return id.substr(0, 12); }
};

// The only component that talks to the container engine. Engine failures
// are turned into data here (exit code -1, false, empty bytes) except where
// a method documents that it throws.
class ContainerRuntime {
public:
    struct Options {
        std::chrono::milliseconds settle_delay{400};
        std::chrono::milliseconds exec_timeout{30000};
        std::string screenshot_path = "/tmp/stockade_screen.png";
    };

    ContainerRuntime(std::shared_ptr<ContainerEngine> engine,
                     std::string image,
                     SecurityPolicy policy,
                     Options options);
    ContainerRuntime(std::shared_ptr<ContainerEngine> engine,
                     std::string image,
                     SecurityPolicy policy);

    const std::string& image() const { return image_; }
    const SecurityPolicy& policy() const { return policy_; }

    // Best effort: logs a build hint when the image is absent and returns
    // false; never throws.
    bool VerifyImage();

    // Throws EngineError when the engine rejects the ContainerSpec.
    ContainerHandle CreateContainer(const std::vector<std::string>& command,
                                    const std::vector<BindMount>& volumes = {},
                                    const std::map<std::string, std::string>& env = {});
    // Throws EngineError.
    void Start(ContainerHandle& handle);

    // Blocks until the container exits or the timeout (policy timeout when
    // unset) elapses. A container that overstays is killed before this
    // returns, and the result is kAbnormalExit.
    int Wait(ContainerHandle& handle, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Throws EngineError.
    ContainerLogs Logs(const ContainerHandle& handle);

    // Force-removes the container. Safe to call repeatedly; an already
    // removed container counts as success. Failures are logged, not thrown.
    bool Destroy(ContainerHandle& handle);

    // Runs argv inside a running container. Throws NotRunningError otherwise;
    // engine failures come back as exit code -1 with the message in stderr.
    // timeout bounds the engine call (exec_timeout when unset). The engine
    // does not stop the process when the deadline passes.
    ExecOutput ExecCommand(const ContainerHandle& handle,
                           const std::vector<std::string>& argv,
                           const std::map<std::string, std::string>& env = {},
                           const std::string& workdir = {},
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    const Options& options() const { return options_; }

    // PNG bytes of the display, or empty when capture or extraction fails.
    std::string TakeScreenshot(const ContainerHandle& handle, const std::string& display);

    // Screenshot, inject, settle, screenshot. Only NotRunningError escapes.
    UIActionResult ExecuteUiAction(const ContainerHandle& handle,
                                   const UIAction& action,
                                   const std::string& display);

    // Unpacks files into dir inside the container. Throws NotRunningError or
    // EngineError.
    void CopyToContainer(const ContainerHandle& handle,
                         const std::string& dir,
                         const std::vector<TarEntry>& files);

private:
    void RequireRunning(const ContainerHandle& handle, const char* operation) const;

    std::shared_ptr<ContainerEngine> engine_;
    std::string image_;
    SecurityPolicy policy_;
    Options options_;
};

}  // namespace stockade::sandbox
