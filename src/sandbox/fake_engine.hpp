#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "sandbox/container_engine.hpp"

namespace stockade::sandbox {

// In-memory ContainerEngine for tests. Behaviour is scripted through the
// public knobs; every call is recorded.
class FakeEngine : public ContainerEngine {
public:
    struct ExecCall {
        std::string id;
        std::vector<std::string> argv;
        std::map<std::string, std::string> env;
        std::string workdir;
        std::chrono::milliseconds timeout{0};
    };

    using ExecHandler = std::function<ExecOutput(const std::vector<std::string>& argv)>;

    bool ImageExists(const std::string& image) override;
    std::string CreateContainer(const ContainerSpec& spec) override;
    void StartContainer(const std::string& id) override;
    std::optional<int> WaitContainer(const std::string& id, std::chrono::milliseconds timeout) override;
    void KillContainer(const std::string& id) override;
    ContainerLogs GetLogs(const std::string& id) override;
    void RemoveContainer(const std::string& id) override;
    ExecOutput Exec(const std::string& id,
                    const std::vector<std::string>& argv,
                    const std::map<std::string, std::string>& env,
                    const std::string& workdir,
                    std::chrono::milliseconds timeout) override;
    std::string GetArchive(const std::string& id, const std::string& path) override;
    void PutArchive(const std::string& id, const std::string& dir, const std::string& archive) override;

    bool IsLive(const std::string& id) const { return live.count(id) > 0; }
    // Exec calls whose argv starts with program.
    std::size_t CountExecs(const std::string& program) const;

    // Knobs.
    bool image_present = true;
    bool fail_create = false;
    bool fail_wait = false;
    bool fail_remove = false;
    bool fail_archive = false;
    // std::nullopt: the container never exits, WaitContainer sleeps for
    // the full timeout.
    std::optional<int> exit_code = 0;
    ContainerLogs logs;
    std::string screenshot = std::string("\x89PNG\r\n\x1a\n", 8) + "fake-image";
    // Default: every command succeeds with no output.
    ExecHandler exec_handler;
    // Called with each spec before the container is recorded.
    std::function<void(const ContainerSpec&)> on_create;

    // Records.
    std::vector<ContainerSpec> created;
    std::vector<std::string> started;
    std::vector<std::string> killed;
    std::vector<std::string> removed;
    std::vector<ExecCall> execs;
    std::vector<std::pair<std::string, std::string>> put_archives;
    std::set<std::string> live;

private:
    int next_id_ = 1;
};

}  // namespace stockade::sandbox
