#include "sandbox/security_policy.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "utils/common.hpp"

using namespace stockade;
using namespace stockade::sandbox;

namespace {

std::filesystem::path TempDir() {
    return std::filesystem::temp_directory_path() / ("stockade_policy_test_" + utils::RandomHex(8));
}

bool Contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

}  // namespace

TEST(SecurityPolicy, StrictPresetIsIsolated)
{
    config::SandboxConfig sandbox{};
    sandbox.network = "bridge";
    sandbox.seccomp_enabled = false;

    const auto spec = StrictPolicy(sandbox, SeccompEncoding::kPath).ToRuntimeSpec();
    EXPECT_EQ(spec.network_mode, "none");
    EXPECT_TRUE(spec.read_only_rootfs);
    EXPECT_EQ(spec.memory_bytes, 256LL * 1024 * 1024);
    EXPECT_EQ(spec.nano_cpus, 1000000000LL);
    EXPECT_EQ(spec.pids_limit, 64);
    EXPECT_EQ(spec.user, "65534:65534");
    EXPECT_EQ(spec.cap_drop, std::vector<std::string>{"ALL"});
    EXPECT_TRUE(Contains(spec.security_opt, "no-new-privileges"));
    EXPECT_TRUE(spec.tmpfs.empty());
}

TEST(SecurityPolicy, StrictPresetTimeout)
{
    config::SandboxConfig sandbox{};
    sandbox.seccomp_enabled = false;
    EXPECT_EQ(StrictPolicy(sandbox, SeccompEncoding::kPath).timeout(), std::chrono::seconds(30));
}

TEST(SecurityPolicy, UiPresetHasWritableRoot)
{
    config::UiSandboxConfig ui{};
    const auto policy = UiPolicy(ui);
    const auto spec = policy.ToRuntimeSpec();
    EXPECT_FALSE(spec.read_only_rootfs);
    EXPECT_EQ(spec.network_mode, "none");
    EXPECT_EQ(spec.memory_bytes, 1024LL * 1024 * 1024);
    EXPECT_EQ(spec.nano_cpus, 1500000000LL);
    EXPECT_EQ(spec.pids_limit, 256);
    EXPECT_EQ(policy.timeout(), std::chrono::seconds(120));

    ui.allow_browser_network = true;
    EXPECT_EQ(UiPolicy(ui).ToRuntimeSpec().network_mode, "bridge");
    EXPECT_FALSE(UiPolicy(ui).ToRuntimeSpec().read_only_rootfs);
}

TEST(SecurityPolicy, ParseMemoryLimit)
{
    EXPECT_EQ(ParseMemoryLimit("512"), 512);
    EXPECT_EQ(ParseMemoryLimit("4k"), 4096);
    EXPECT_EQ(ParseMemoryLimit("256m"), 268435456);
    EXPECT_EQ(ParseMemoryLimit("1G"), 1073741824LL);
    EXPECT_THROW(ParseMemoryLimit(""), std::invalid_argument);
    EXPECT_THROW(ParseMemoryLimit("m"), std::invalid_argument);
    EXPECT_THROW(ParseMemoryLimit("12mb"), std::invalid_argument);
    EXPECT_THROW(ParseMemoryLimit("3t"), std::invalid_argument);
}

TEST(SecurityPolicy, ParseMemoryLimitRejectsOverflow)
{
    EXPECT_EQ(ParseMemoryLimit("8589934591g"), 8589934591LL * 1024 * 1024 * 1024);
    EXPECT_THROW(ParseMemoryLimit("8589934592g"), std::invalid_argument);
    EXPECT_THROW(ParseMemoryLimit("9999999999g"), std::invalid_argument);
    EXPECT_THROW(ParseMemoryLimit("99999999999999999999"), std::invalid_argument);
}

TEST(SecurityPolicy, ProfileDeniesByDefault)
{
    const auto profile = BuildSeccompProfile();
    EXPECT_EQ(profile["defaultAction"], "SCMP_ACT_ERRNO");
    ASSERT_EQ(profile["syscalls"].size(), 1u);
    EXPECT_EQ(profile["syscalls"][0]["action"], "SCMP_ACT_ALLOW");
    EXPECT_EQ(profile["archMap"][0]["architecture"], "SCMP_ARCH_X86_64");

    const auto names = profile["syscalls"][0]["names"].get<std::vector<std::string>>();
    EXPECT_GE(names.size(), 90u);
    for (const char* allowed : {"read", "write", "mmap", "execve", "rt_sigaction", "epoll_wait", "futex"}) {
        EXPECT_TRUE(Contains(names, allowed)) << allowed;
    }
    for (const char* denied : {"ptrace", "mount", "umount2", "reboot", "kexec_load",
                               "init_module", "finit_module", "delete_module", "pivot_root"}) {
        EXPECT_FALSE(Contains(names, denied)) << denied;
    }
}

TEST(SecurityPolicy, WritesProfileAndReferencesPath)
{
    const auto dir = TempDir();
    config::SandboxConfig sandbox{};
    sandbox.security_dir = dir.string();

    const auto policy = StrictPolicy(sandbox, SeccompEncoding::kPath);
    const auto path = dir / "seccomp.json";
    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(policy.seccomp_profile_path(), path.string());
    EXPECT_TRUE(Contains(policy.ToRuntimeSpec().security_opt, "seccomp=" + path.string()));

    std::filesystem::remove_all(dir);
}

TEST(SecurityPolicy, InlineEncodingEmbedsDocument)
{
    const auto dir = TempDir();
    config::SandboxConfig sandbox{};
    sandbox.security_dir = dir.string();

    const auto policy = StrictPolicy(sandbox, SeccompEncoding::kInline);
    // Read once at construction; later calls work without the file.
    std::filesystem::remove_all(dir);

    const auto spec = policy.ToRuntimeSpec();
    const auto it = std::find_if(spec.security_opt.begin(), spec.security_opt.end(),
                                 [](const std::string& opt) { return opt.rfind("seccomp=", 0) == 0; });
    ASSERT_NE(it, spec.security_opt.end());
    const auto document = nlohmann::json::parse(it->substr(8));
    EXPECT_EQ(document, BuildSeccompProfile());
    EXPECT_EQ(it->find('\n'), std::string::npos);
}

TEST(SecurityPolicy, DetectSeccompEncoding)
{
    config::EngineConfig engine{};
    EXPECT_EQ(DetectSeccompEncoding(engine), SeccompEncoding::kPath);

    engine.host = "tcp://10.0.0.5:2375";
    EXPECT_EQ(DetectSeccompEncoding(engine), SeccompEncoding::kInline);

    engine.seccomp_mode = "path";
    EXPECT_EQ(DetectSeccompEncoding(engine), SeccompEncoding::kPath);

    engine.host = "unix:///var/run/docker.sock";
    engine.seccomp_mode = "inline";
    EXPECT_EQ(DetectSeccompEncoding(engine), SeccompEncoding::kInline);
}

TEST(SecurityPolicy, NoProfileWhenDisabled)
{
    config::SandboxConfig sandbox{};
    sandbox.seccomp_enabled = false;
    const auto spec = StrictPolicy(sandbox, SeccompEncoding::kPath).ToRuntimeSpec();
    for (const auto& opt : spec.security_opt) {
        EXPECT_NE(opt.rfind("seccomp=", 0), 0u) << opt;
    }
}
