#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/sandbox_types.hpp"
#include "sandbox/security_policy.hpp"

namespace stockade::sandbox {

struct BindMount {
    std::string source;
    std::string target;
    bool read_only = true;
};

struct ContainerSpec {
    std::string image;
    // Empty keeps the image's own entrypoint and command.
    std::vector<std::string> command;
    std::map<std::string, std::string> env;
    std::vector<BindMount> binds;
    RuntimeSpec runtime;
};

struct ContainerLogs {
    std::string stdout_text;
    std::string stderr_text;
    bool truncated = false;
};

// The container-engine operations the sandbox consumes. Implementations
// throw EngineError on refusal or transport failure.
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    virtual bool ImageExists(const std::string& image) = 0;
    // Returns the new container id; the container is created, not started.
    virtual std::string CreateContainer(const ContainerSpec& spec) = 0;
    virtual void StartContainer(const std::string& id) = 0;
    // Exit status, or std::nullopt when the timeout elapsed first.
    virtual std::optional<int> WaitContainer(const std::string& id, std::chrono::milliseconds timeout) = 0;
    virtual void KillContainer(const std::string& id) = 0;
    virtual ContainerLogs GetLogs(const std::string& id) = 0;
    // Force-removes the container and its anonymous volumes.
    virtual void RemoveContainer(const std::string& id) = 0;
    virtual ExecOutput Exec(const std::string& id,
                            const std::vector<std::string>& argv,
                            const std::map<std::string, std::string>& env,
                            const std::string& workdir,
                            std::chrono::milliseconds timeout) = 0;
    // Tar archive of the file or directory at path.
    virtual std::string GetArchive(const std::string& id, const std::string& path) = 0;
    // Extracts a tar archive into the directory dir.
    virtual void PutArchive(const std::string& id, const std::string& dir, const std::string& archive) = 0;
};

}  // namespace stockade::sandbox
