#include "sandbox/code_executor.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace stockade::sandbox {
namespace {

constexpr const char* kTag = "sandbox";
constexpr const char* kInputDir = "/input";
constexpr const char* kScriptName = "task.py";

bool IsBlank(const std::string& code) {
    return std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isspace(c); });
}

class ScratchDir {
public:
    explicit ScratchDir(const std::filesystem::path& root)
        : path_(root / ("stockade_sandbox_" + utils::RandomHex(12))) {
        std::filesystem::create_directories(path_);
        // The container user is unprivileged and must be able to read it.
        std::filesystem::permissions(path_, std::filesystem::perms(0755));
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            utils::LogWarn(kTag, "cannot remove " + path_.string() + ": " + ec.message());
        }
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    void Write(const std::string& name, const std::string& content) const {
        const auto file = path_ / name;
        std::ofstream output(file, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw std::runtime_error("cannot write " + file.string());
        }
        output << content;
        output.close();
        if (!output) {
            throw std::runtime_error("short write to " + file.string());
        }
        std::filesystem::permissions(file, std::filesystem::perms(0644));
    }

private:
    std::filesystem::path path_;
};

class ContainerGuard {
public:
    ContainerGuard(ContainerRuntime& runtime, ContainerHandle& handle)
        : runtime_(runtime)
        , handle_(handle) {}

    ~ContainerGuard() {
        runtime_.Destroy(handle_);
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    ContainerRuntime& runtime_;
    ContainerHandle& handle_;
};

}  // namespace

CodeExecutor::CodeExecutor(std::shared_ptr<ContainerEngine> engine,
                           std::string image,
                           SecurityPolicy policy,
                           Options options)
    : runtime_(std::move(engine), std::move(image), std::move(policy), options.runtime)
    , options_(std::move(options)) {}

CodeExecutor::CodeExecutor(std::shared_ptr<ContainerEngine> engine,
                           std::string image,
                           SecurityPolicy policy)
    : CodeExecutor(std::move(engine), std::move(image), std::move(policy), Options{}) {}

ExecutionResult CodeExecutor::Execute(const std::string& code) {
    if (IsBlank(code)) {
        ExecutionResult result{};
        result.exit_code = 1;
        result.stderr_text = "Empty code buffer - nothing executed.";
        result.failure = FailureKind::kEmptyInput;
        return result;
    }

    const auto start = std::chrono::steady_clock::now();
    auto result = RunInContainer(code);
    result.duration_ms = utils::ElapsedMs(start);

    utils::Log({result.failure == FailureKind::kNone || result.failure == FailureKind::kExecutionFailure
                    ? utils::LogLevel::kInfo
                    : utils::LogLevel::kWarn,
                kTag, "execution finished",
                {{"exit_code", std::to_string(result.exit_code)},
                 {"failure", ToString(result.failure)},
                 {"duration_ms", std::to_string(static_cast<long long>(result.duration_ms))}}});
    return result;
}

ExecutionResult CodeExecutor::RunInContainer(const std::string& code) {
    ExecutionResult result{};
    try {
        ScratchDir scratch(options_.scratch_root);
        scratch.Write(kScriptName, code);

        ContainerHandle handle{};
        ContainerGuard guard(runtime_, handle);
        handle = runtime_.CreateContainer(
            {options_.interpreter, std::string(kInputDir) + "/" + kScriptName},
            {BindMount{scratch.path().string(), kInputDir, true}});
        runtime_.Start(handle);

        result.exit_code = runtime_.Wait(handle);
        if (result.exit_code == kAbnormalExit && !handle.error.empty()) {
            result.error = handle.error;
            result.failure = FailureKind::kRuntimeFailure;
            return result;
        }
        if (result.exit_code == kAbnormalExit) {
            result.timed_out = true;
            result.failure = FailureKind::kTimeout;
            result.error = "execution timed out after " +
                std::to_string(runtime_.policy().timeout().count()) + "s";
        } else {
            result.failure = result.exit_code == 0 ? FailureKind::kNone : FailureKind::kExecutionFailure;
        }

        auto logs = runtime_.Logs(handle);
        result.stdout_text = std::move(logs.stdout_text);
        result.stderr_text = std::move(logs.stderr_text);
        result.output_truncated = logs.truncated;
    } catch (const std::exception& ex) {
        utils::LogError(kTag, std::string("execution failed: ") + ex.what());
        if (result.error.empty()) {
            result.error = ex.what();
        } else {
            result.error += "; " + std::string(ex.what());
        }
        if (!result.timed_out) {
            result.exit_code = kAbnormalExit;
            result.failure = FailureKind::kRuntimeFailure;
        }
    }
    return result;
}

std::unique_ptr<CodeExecutor> CreateCodeExecutor(const config::Config& config,
                                                 std::shared_ptr<ContainerEngine> engine) {
    CodeExecutor::Options options{};
    options.interpreter = config.sandbox.interpreter;
    auto policy = StrictPolicy(config.sandbox, DetectSeccompEncoding(config.engine));
    return std::make_unique<CodeExecutor>(std::move(engine), config.sandbox.image, std::move(policy), options);
}

}  // namespace stockade::sandbox
