#include "sandbox/security_policy.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

#include "utils/logging.hpp"

namespace stockade::sandbox {
namespace {

constexpr const char* kTag = "policy";

std::string ReadCompactProfile(const std::string& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    auto profile = nlohmann::json::parse(input, nullptr, false);
    if (profile.is_discarded()) {
        throw std::runtime_error("invalid JSON in " + path);
    }
    return profile.dump();
}

}  // namespace

const char* ToString(SeccompEncoding encoding) {
    switch (encoding) {
        case SeccompEncoding::kPath: return "path";
        case SeccompEncoding::kInline: return "inline";
    }
    return "path";
}

SecurityPolicy::SecurityPolicy(PolicyOptions options, SeccompEncoding encoding)
    : options_(std::move(options))
    , encoding_(encoding) {
    if (options_.seccomp_profile_path.empty()) {
        return;
    }
    if (encoding_ == SeccompEncoding::kPath) {
        seccomp_option_ = "seccomp=" + options_.seccomp_profile_path;
        return;
    }
    try {
        seccomp_option_ = "seccomp=" + ReadCompactProfile(options_.seccomp_profile_path);
    } catch (const std::exception& ex) {
        utils::LogWarn(kTag, std::string("inline seccomp profile unavailable, using engine default: ") + ex.what());
    }
}

RuntimeSpec SecurityPolicy::ToRuntimeSpec() const {
    RuntimeSpec spec{};
    spec.network_mode = options_.network_mode;
    spec.memory_bytes = ParseMemoryLimit(options_.memory_limit);
    spec.nano_cpus = static_cast<std::int64_t>(std::llround(options_.cpu_limit * 1e9));
    spec.pids_limit = options_.pids_limit;
    spec.user = options_.user;
    spec.cap_drop = options_.cap_drop;
    spec.security_opt = options_.security_opts;
    if (!seccomp_option_.empty()) {
        spec.security_opt.push_back(seccomp_option_);
    }
    spec.read_only_rootfs = options_.read_only_rootfs;
    spec.tmpfs = options_.tmpfs;
    return spec;
}

std::int64_t ParseMemoryLimit(const std::string& value) {
    if (value.empty()) {
        throw std::invalid_argument("empty memory limit");
    }
    std::size_t digits = 0;
    while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        throw std::invalid_argument("invalid memory limit '" + value + "'");
    }
    const std::string suffix = value.substr(digits);
    if (suffix.size() > 1) {
        throw std::invalid_argument("invalid memory limit '" + value + "'");
    }
    const char unit = suffix.empty() ? 'b' : static_cast<char>(std::tolower(static_cast<unsigned char>(suffix[0])));
    std::int64_t multiplier = 1;
    switch (unit) {
        case 'b': multiplier = 1; break;
        case 'k': multiplier = 1024; break;
        case 'm': multiplier = 1024 * 1024; break;
        case 'g': multiplier = 1024 * 1024 * 1024; break;
        default:
            throw std::invalid_argument("invalid memory limit '" + value + "'");
    }

    std::int64_t amount = 0;
    try {
        amount = std::stoll(value.substr(0, digits));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("memory limit '" + value + "' is too large");
    }
    if (amount > std::numeric_limits<std::int64_t>::max() / multiplier) {
        throw std::invalid_argument("memory limit '" + value + "' is too large");
    }
    return amount * multiplier;
}

const std::vector<std::string>& AllowedSyscalls() {
    // Enough for CPython and NumPy. Deliberately absent: ptrace,
    // process_vm_*, mount/umount2, pivot_root, reboot, kexec_*, *_module,
    // bpf, perf_event_open, keyctl, unshare, setns.
    static const std::vector<std::string> kAllowed = {
        // process
        "exit", "exit_group", "getpid", "getppid", "gettid",
        "clone", "clone3", "fork", "vfork", "wait4", "waitid",
        "execve", "execveat",
        // memory
        "mmap", "munmap", "mprotect", "mremap", "brk",
        "madvise", "mlock", "munlock",
        // file I/O
        "open", "openat", "close", "read", "write", "pread64", "pwrite64",
        "readv", "writev", "lseek", "fstat", "newfstatat", "stat", "lstat",
        "fstatfs", "statfs", "statx",
        "access", "faccessat", "faccessat2",
        "dup", "dup2", "dup3", "fcntl",
        "ioctl", "flock",
        "mkdir", "mkdirat", "rmdir", "unlink", "unlinkat",
        "rename", "renameat", "renameat2",
        "readlink", "readlinkat",
        "getcwd", "chdir", "fchdir",
        "getdents", "getdents64",
        "ftruncate", "truncate",
        "fallocate", "copy_file_range",
        "sendfile",
        // pipes and sockets
        "pipe", "pipe2", "socketpair",
        "socket", "connect", "bind", "listen",
        "accept", "accept4",
        "getsockname", "getpeername",
        "setsockopt", "getsockopt",
        "sendto", "recvfrom", "sendmsg", "recvmsg",
        "shutdown",
        "select", "pselect6",
        // signals
        "rt_sigaction", "rt_sigprocmask", "rt_sigreturn",
        "sigaltstack", "kill", "tgkill",
        // time
        "clock_gettime", "clock_getres", "clock_nanosleep",
        "nanosleep", "gettimeofday",
        // polling
        "epoll_create", "epoll_create1", "epoll_ctl", "epoll_wait",
        "epoll_pwait", "epoll_pwait2",
        "poll", "ppoll",
        "eventfd", "eventfd2",
        // misc
        "getrandom", "arch_prctl", "prctl", "set_tid_address",
        "set_robust_list", "get_robust_list",
        "futex", "futex_waitv",
        "sched_yield", "sched_getaffinity",
        "getuid", "getgid", "geteuid", "getegid",
        "getgroups", "setgroups",
        "uname", "sysinfo",
        "umask", "chown", "fchown", "fchownat",
        "chmod", "fchmod", "fchmodat",
        "utimensat",
        "timerfd_create", "timerfd_settime", "timerfd_gettime",
        "memfd_create",
        "prlimit64", "getrlimit", "setrlimit",
        "rseq",
    };
    return kAllowed;
}

nlohmann::json BuildSeccompProfile() {
    return {
        {"defaultAction", "SCMP_ACT_ERRNO"},
        {"archMap", nlohmann::json::array({
            {
                {"architecture", "SCMP_ARCH_X86_64"},
                {"subArchitectures", nlohmann::json::array({"SCMP_ARCH_X86", "SCMP_ARCH_X32"})}
            },
            {
                {"architecture", "SCMP_ARCH_AARCH64"},
                {"subArchitectures", nlohmann::json::array({"SCMP_ARCH_ARM"})}
            }
        })},
        {"syscalls", nlohmann::json::array({
            {
                {"names", AllowedSyscalls()},
                {"action", "SCMP_ACT_ALLOW"}
            }
        })}
    };
}

std::filesystem::path WriteSeccompProfile(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("cannot create " + dir.string() + ": " + ec.message());
    }
    const auto path = dir / "seccomp.json";
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("cannot write " + path.string());
    }
    output << BuildSeccompProfile().dump(2);
    if (!output) {
        throw std::runtime_error("short write to " + path.string());
    }
    utils::LogInfo(kTag, "seccomp profile written to " + path.string());
    return path;
}

SeccompEncoding DetectSeccompEncoding(const config::EngineConfig& engine) {
    if (engine.seccomp_mode == "path") {
        return SeccompEncoding::kPath;
    }
    if (engine.seccomp_mode == "inline") {
        return SeccompEncoding::kInline;
    }
#if !defined(__linux__)
    // Docker Desktop runs the engine inside a VM.
    return SeccompEncoding::kInline;
#else
    if (engine.host.rfind("unix://", 0) == 0 || engine.host.empty()) {
        return SeccompEncoding::kPath;
    }
    return SeccompEncoding::kInline;
#endif
}

SecurityPolicy StrictPolicy(const config::SandboxConfig& sandbox, SeccompEncoding encoding) {
    PolicyOptions options{};
    if (sandbox.network != "none") {
        utils::LogWarn(kTag, "code sandbox network '" + sandbox.network + "' ignored; forcing none");
    }
    options.network_mode = "none";
    options.memory_limit = sandbox.memory_limit;
    options.cpu_limit = sandbox.cpu_limit;
    options.pids_limit = sandbox.pids_limit;
    options.read_only_rootfs = true;
    options.timeout = std::chrono::seconds(sandbox.timeout_s);
    // Code arrives through the read-only /input bind mount.
    options.tmpfs.clear();

    if (sandbox.seccomp_enabled) {
        try {
            options.seccomp_profile_path = WriteSeccompProfile(sandbox.security_dir).string();
        } catch (const std::exception& ex) {
            utils::LogWarn(kTag, std::string("seccomp profile generation skipped: ") + ex.what());
        }
    }
    return SecurityPolicy(std::move(options), encoding);
}

SecurityPolicy UiPolicy(const config::UiSandboxConfig& ui) {
    PolicyOptions options{};
    options.network_mode = ui.allow_browser_network ? "bridge" : "none";
    options.memory_limit = ui.memory_limit;
    options.cpu_limit = ui.cpu_limit;
    options.pids_limit = ui.pids_limit;
    options.read_only_rootfs = false;
    options.timeout = std::chrono::seconds(ui.timeout_s);
    // The image manages its own /tmp.
    options.tmpfs.clear();
    return SecurityPolicy(std::move(options), SeccompEncoding::kPath);
}

}  // namespace stockade::sandbox
