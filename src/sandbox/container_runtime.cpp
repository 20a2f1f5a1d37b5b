#include "sandbox/container_runtime.hpp"

#include <filesystem>
#include <thread>

#include "sandbox/action_mapping.hpp"
#include "sandbox/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace stockade::sandbox {
namespace {

constexpr const char* kTag = "sandbox";

std::string BaseName(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

// The archive API returns a tar even for a single file. Prefer the entry
// named like the requested file, else the first regular file.
std::string PickScreenshot(const std::vector<TarEntry>& entries, const std::string& path) {
    const auto wanted = BaseName(path);
    for (const auto& entry : entries) {
        if (BaseName(entry.name) == wanted) {
            return entry.data;
        }
    }
    if (!entries.empty()) {
        if (entries.size() > 1) {
            utils::LogWarn(kTag, "screenshot archive has " + std::to_string(entries.size()) +
                " files, none named " + wanted + "; using " + entries.front().name);
        }
        return entries.front().data;
    }
    return {};
}

}  // namespace

const char* ToString(ContainerState state) {
    switch (state) {
        case ContainerState::kCreated: return "created";
        case ContainerState::kRunning: return "running";
        case ContainerState::kExited: return "exited";
        case ContainerState::kKilled: return "killed";
        case ContainerState::kDestroyed: return "destroyed";
    }
    return "unknown";
}

ContainerRuntime::ContainerRuntime(std::shared_ptr<ContainerEngine> engine,
                                   std::string image,
                                   SecurityPolicy policy,
                                   Options options)
    : engine_(std::move(engine))
    , image_(std::move(image))
    , policy_(std::move(policy))
    , options_(std::move(options)) {}

ContainerRuntime::ContainerRuntime(std::shared_ptr<ContainerEngine> engine,
                                   std::string image,
                                   SecurityPolicy policy)
    : ContainerRuntime(std::move(engine), std::move(image), std::move(policy), Options{}) {}

bool ContainerRuntime::VerifyImage() {
    try {
        if (engine_->ImageExists(image_)) {
            return true;
        }
        utils::LogWarn(kTag, "image " + image_ + " not found; build it with: docker build -t " +
            image_ + " <sandbox-image-dir>");
    } catch (const std::exception& ex) {
        utils::LogWarn(kTag, "cannot inspect image " + image_ + ": " + ex.what());
    }
    return false;
}

ContainerHandle ContainerRuntime::CreateContainer(const std::vector<std::string>& command,
                                                  const std::vector<BindMount>& volumes,
                                                  const std::map<std::string, std::string>& env) {
    ContainerSpec spec{};
    spec.image = image_;
    spec.command = command;
    spec.env = env;
    spec.binds = volumes;
    spec.runtime = policy_.ToRuntimeSpec();

    ContainerHandle handle{};
    handle.id = engine_->CreateContainer(spec);
    handle.state = ContainerState::kCreated;
    utils::Log({utils::LogLevel::kDebug, kTag, "container created",
                {{"id", handle.ShortId()}, {"image", image_}}});
    return handle;
}

void ContainerRuntime::Start(ContainerHandle& handle) {
    engine_->StartContainer(handle.id);
    handle.state = ContainerState::kRunning;
}

int ContainerRuntime::Wait(ContainerHandle& handle, std::optional<std::chrono::milliseconds> timeout) {
    const auto limit = timeout.value_or(std::chrono::duration_cast<std::chrono::milliseconds>(policy_.timeout()));
    std::optional<int> status;
    try {
        status = engine_->WaitContainer(handle.id, limit);
    } catch (const std::exception& ex) {
        handle.error = ex.what();
        utils::LogError(kTag, "wait on " + handle.ShortId() + " failed: " + handle.error);
    }

    if (status) {
        handle.state = ContainerState::kExited;
        return *status;
    }

    if (handle.error.empty()) {
        utils::Log({utils::LogLevel::kWarn, kTag, "container timed out, killing",
                    {{"id", handle.ShortId()}, {"timeout_ms", std::to_string(limit.count())}}});
    }
    try {
        engine_->KillContainer(handle.id);
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "kill " + handle.ShortId() + " failed: " + ex.what());
    }
    handle.state = ContainerState::kKilled;
    return kAbnormalExit;
}

ContainerLogs ContainerRuntime::Logs(const ContainerHandle& handle) {
    return engine_->GetLogs(handle.id);
}

bool ContainerRuntime::Destroy(ContainerHandle& handle) {
    if (handle.id.empty() || handle.state == ContainerState::kDestroyed) {
        return true;
    }
    try {
        engine_->RemoveContainer(handle.id);
    } catch (const EngineError& ex) {
        if (!ex.IsNotFound()) {
            utils::LogError(kTag, "destroy " + handle.ShortId() + " failed: " + ex.what());
            return false;
        }
    } catch (const std::exception& ex) {
        utils::LogError(kTag, "destroy " + handle.ShortId() + " failed: " + ex.what());
        return false;
    }
    handle.state = ContainerState::kDestroyed;
    return true;
}

void ContainerRuntime::RequireRunning(const ContainerHandle& handle, const char* operation) const {
    if (handle.id.empty() || handle.state != ContainerState::kRunning) {
        throw NotRunningError(std::string(operation) + " requires a running container (state " +
            ToString(handle.state) + ")");
    }
}

ExecOutput ContainerRuntime::ExecCommand(const ContainerHandle& handle,
                                         const std::vector<std::string>& argv,
                                         const std::map<std::string, std::string>& env,
                                         const std::string& workdir,
                                         std::optional<std::chrono::milliseconds> timeout) {
    RequireRunning(handle, "exec");
    try {
        return engine_->Exec(handle.id, argv, env, workdir, timeout.value_or(options_.exec_timeout));
    } catch (const std::exception& ex) {
        ExecOutput output{};
        output.exit_code = kAbnormalExit;
        output.stderr_text = ex.what();
        return output;
    }
}

std::string ContainerRuntime::TakeScreenshot(const ContainerHandle& handle, const std::string& display) {
    RequireRunning(handle, "screenshot");
    const auto capture = ExecCommand(handle, {"scrot", "-o", options_.screenshot_path}, {{"DISPLAY", display}});
    if (capture.exit_code != 0) {
        utils::LogError(kTag, "screenshot capture failed (exit " + std::to_string(capture.exit_code) +
            "): " + capture.stderr_text);
        return {};
    }
    try {
        const auto archive = engine_->GetArchive(handle.id, options_.screenshot_path);
        auto image = PickScreenshot(ParseTar(archive), options_.screenshot_path);
        if (image.empty()) {
            utils::LogError(kTag, "screenshot archive for " + options_.screenshot_path + " is empty");
        }
        return image;
    } catch (const std::exception& ex) {
        utils::LogError(kTag, std::string("screenshot extraction failed: ") + ex.what());
        return {};
    }
}

UIActionResult ContainerRuntime::ExecuteUiAction(const ContainerHandle& handle,
                                                 const UIAction& action,
                                                 const std::string& display) {
    RequireRunning(handle, "ui action");
    const auto start = std::chrono::steady_clock::now();

    UIActionResult result{};
    result.action = action;
    result.screenshot_before = TakeScreenshot(handle, display);

    const auto argv = BuildInputCommand(action);
    const auto output = ExecCommand(handle, argv, {{"DISPLAY", display}});
    std::this_thread::sleep_for(options_.settle_delay);

    result.screenshot_after = TakeScreenshot(handle, display);
    result.success = output.exit_code == 0;
    if (!result.success) {
        result.failure = FailureKind::kCommandFailed;
        result.error = output.stderr_text.empty()
            ? "input command exited with " + std::to_string(output.exit_code)
            : output.stderr_text;
        utils::LogWarn(kTag, std::string(ActionName(action)) + " failed: " + result.error);
    }
    result.duration_ms = utils::ElapsedMs(start);
    return result;
}

void ContainerRuntime::CopyToContainer(const ContainerHandle& handle,
                                       const std::string& dir,
                                       const std::vector<TarEntry>& files) {
    RequireRunning(handle, "copy");
    engine_->PutArchive(handle.id, dir, BuildTar(files));
}

}  // namespace stockade::sandbox
