#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace stockade::sandbox {

// How the syscall profile reaches the engine: as a host path the engine can
// open, or as the serialized document itself.
enum class SeccompEncoding {
    kPath,
    kInline
};

const char* ToString(SeccompEncoding encoding);

// Container-engine creation parameters derived from a SecurityPolicy.
struct RuntimeSpec {
    std::string network_mode;
    std::int64_t memory_bytes = 0;
    std::int64_t nano_cpus = 0;
    std::int64_t pids_limit = 0;
    std::string user;
    std::vector<std::string> cap_drop;
    std::vector<std::string> security_opt;
    bool read_only_rootfs = true;
    std::map<std::string, std::string> tmpfs;
};

struct PolicyOptions {
    std::string network_mode = "none";
    std::string memory_limit = "256m";
    double cpu_limit = 1.0;
    int pids_limit = 64;
    std::string user = "65534:65534";
    std::vector<std::string> cap_drop = {"ALL"};
    std::vector<std::string> security_opts = {"no-new-privileges"};
    bool read_only_rootfs = true;
    // Empty means the engine's default profile.
    std::string seccomp_profile_path;
    std::map<std::string, std::string> tmpfs = {{"/tmp", "rw,noexec,nosuid,size=64m"}};
    std::chrono::seconds timeout{30};
};

// Immutable isolation and resource constraints for one kind of container.
// The seccomp encoding is fixed at construction; for kInline the profile is
// read and minified once here rather than on every ToRuntimeSpec() call.
class SecurityPolicy {
public:
    explicit SecurityPolicy(PolicyOptions options = {},
                            SeccompEncoding encoding = SeccompEncoding::kPath);

    const std::string& network_mode() const { return options_.network_mode; }
    const std::string& memory_limit() const { return options_.memory_limit; }
    double cpu_limit() const { return options_.cpu_limit; }
    int pids_limit() const { return options_.pids_limit; }
    const std::string& user() const { return options_.user; }
    const std::vector<std::string>& cap_drop() const { return options_.cap_drop; }
    const std::vector<std::string>& security_opts() const { return options_.security_opts; }
    bool read_only_rootfs() const { return options_.read_only_rootfs; }
    const std::string& seccomp_profile_path() const { return options_.seccomp_profile_path; }
    const std::map<std::string, std::string>& tmpfs() const { return options_.tmpfs; }
    std::chrono::seconds timeout() const { return options_.timeout; }
    SeccompEncoding seccomp_encoding() const { return encoding_; }

    RuntimeSpec ToRuntimeSpec() const;

private:
    PolicyOptions options_;
    SeccompEncoding encoding_;
    std::string seccomp_option_;
};

// "256m" -> 268435456. Accepts b/k/m/g suffixes (case-insensitive) or a plain
// byte count; throws std::invalid_argument otherwise.
std::int64_t ParseMemoryLimit(const std::string& value);

// Syscalls the strict profile allows; everything else fails with EPERM.
const std::vector<std::string>& AllowedSyscalls();

nlohmann::json BuildSeccompProfile();

// Writes <dir>/seccomp.json and returns its path. Throws std::runtime_error
// when the directory or file cannot be written.
std::filesystem::path WriteSeccompProfile(const std::filesystem::path& dir);

// kInline for remote (tcp/ssh) or VM-backed engines that cannot open host
// paths, kPath for a local Linux socket. engine.seccomp_mode "path" or
// "inline" overrides the detection.
SeccompEncoding DetectSeccompEncoding(const config::EngineConfig& engine);

// Strict preset for one-shot code execution: no network and a read-only root
// regardless of what the config asks for.
SecurityPolicy StrictPolicy(const config::SandboxConfig& sandbox, SeccompEncoding encoding);

// Relaxed preset for the virtual desktop: writable root for the X11 socket
// files; network only when allow_browser_network is set.
SecurityPolicy UiPolicy(const config::UiSandboxConfig& ui);

}  // namespace stockade::sandbox
