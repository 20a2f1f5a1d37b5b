#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/container_engine.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/sandbox_types.hpp"
#include "sandbox/security_policy.hpp"

namespace stockade::sandbox {

// Runs one source buffer per call in a fresh container:
// created -> started -> waited -> logs captured -> destroyed.
// The container and the scratch directory are removed on every path.
// Instances are independent; separate instances may run concurrently.
class CodeExecutor {
public:
    struct Options {
        std::string interpreter = "python";
        // Parent of the per-call scratch directories; must be visible to
        // the engine as a bind-mount source.
        std::filesystem::path scratch_root = std::filesystem::temp_directory_path();
        ContainerRuntime::Options runtime;
    };

    CodeExecutor(std::shared_ptr<ContainerEngine> engine,
                 std::string image,
                 SecurityPolicy policy,
                 Options options);
    CodeExecutor(std::shared_ptr<ContainerEngine> engine,
                 std::string image,
                 SecurityPolicy policy);

    // One call is one attempt. Infrastructure failures are reported in the
    // result; this does not throw.
    ExecutionResult Execute(const std::string& code);

    ContainerRuntime& runtime() { return runtime_; }

private:
    ExecutionResult RunInContainer(const std::string& code);

    ContainerRuntime runtime_;
    Options options_;
};

// Strict-preset executor wired from the sandbox and engine config sections.
std::unique_ptr<CodeExecutor> CreateCodeExecutor(const config::Config& config,
                                                 std::shared_ptr<ContainerEngine> engine);

}  // namespace stockade::sandbox
