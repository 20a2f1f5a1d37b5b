#include "sandbox/fake_engine.hpp"

#include <filesystem>
#include <thread>

#include "sandbox/errors.hpp"
#include "sandbox/tar_stream.hpp"

namespace stockade::sandbox {

bool FakeEngine::ImageExists(const std::string&) {
    return image_present;
}

std::string FakeEngine::CreateContainer(const ContainerSpec& spec) {
    if (fail_create) {
        throw EngineError("No such image: " + spec.image, 404);
    }
    if (on_create) {
        on_create(spec);
    }
    created.push_back(spec);
    const auto id = "fake" + std::to_string(next_id_++) + std::string(60, '0');
    live.insert(id);
    return id;
}

void FakeEngine::StartContainer(const std::string& id) {
    started.push_back(id);
}

std::optional<int> FakeEngine::WaitContainer(const std::string&, std::chrono::milliseconds timeout) {
    if (fail_wait) {
        throw EngineError("connection reset");
    }
    if (!exit_code) {
        std::this_thread::sleep_for(timeout);
    }
    return exit_code;
}

void FakeEngine::KillContainer(const std::string& id) {
    killed.push_back(id);
}

ContainerLogs FakeEngine::GetLogs(const std::string&) {
    return logs;
}

void FakeEngine::RemoveContainer(const std::string& id) {
    removed.push_back(id);
    if (fail_remove) {
        throw EngineError("removal of container " + id + " is already in progress", 409);
    }
    if (live.erase(id) == 0) {
        throw EngineError("No such container: " + id, 404);
    }
}

ExecOutput FakeEngine::Exec(const std::string& id,
                            const std::vector<std::string>& argv,
                            const std::map<std::string, std::string>& env,
                            const std::string& workdir,
                            std::chrono::milliseconds timeout) {
    execs.push_back(ExecCall{id, argv, env, workdir, timeout});
    if (exec_handler) {
        return exec_handler(argv);
    }
    ExecOutput output{};
    output.exit_code = 0;
    return output;
}

std::string FakeEngine::GetArchive(const std::string&, const std::string& path) {
    if (fail_archive) {
        throw EngineError("Could not find the file " + path + " in container", 404);
    }
    return BuildTar({TarEntry{std::filesystem::path(path).filename().string(), screenshot, 0644}});
}

void FakeEngine::PutArchive(const std::string&, const std::string& dir, const std::string& archive) {
    put_archives.emplace_back(dir, archive);
}

std::size_t FakeEngine::CountExecs(const std::string& program) const {
    std::size_t count = 0;
    for (const auto& call : execs) {
        if (!call.argv.empty() && call.argv.front() == program) {
            ++count;
        }
    }
    return count;
}

}  // namespace stockade::sandbox
