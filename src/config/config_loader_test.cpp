#include "config/config_loader.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"

using namespace stockade::config;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kVars) {
            ::unsetenv(name);
        }
        dir = std::filesystem::temp_directory_path() / ("stockade_config_test_" + stockade::utils::RandomHex(8));
        std::filesystem::create_directories(dir);
        path = dir / "config.json";
    }

    void TearDown() override {
        for (const char* name : kVars) {
            ::unsetenv(name);
        }
        std::filesystem::remove_all(dir);
    }

    void Write(const std::string& text) {
        std::ofstream output(path);
        output << text;
    }

    static constexpr const char* kVars[] = {
        "DOCKER_HOST",
        "STOCKADE_ENGINE__HOST",
        "STOCKADE_SANDBOX__TIMEOUT_S",
        "STOCKADE_SANDBOX_IMAGE",
        "STOCKADE_UI_SANDBOX__ALLOW_BROWSER_NETWORK",
        "STOCKADE_LOG_LEVEL",
    };

    std::filesystem::path dir;
    std::filesystem::path path;
};

TEST_F(ConfigLoaderTest, DefaultsWithoutFile)
{
    const auto config = LoadConfig(dir / "missing.json");
    EXPECT_EQ(config.engine.host, "unix:///var/run/docker.sock");
    EXPECT_EQ(config.engine.api_version, "v1.41");
    EXPECT_EQ(config.engine.max_response_mb, 16);
    EXPECT_EQ(config.sandbox.image, "stockade-sandbox:latest");
    EXPECT_EQ(config.sandbox.timeout_s, 30);
    EXPECT_EQ(config.sandbox.memory_limit, "256m");
    EXPECT_EQ(config.ui_sandbox.timeout_s, 120);
    EXPECT_EQ(config.ui_sandbox.display, ":99");
    EXPECT_FALSE(config.ui_sandbox.allow_browser_network);
    EXPECT_EQ(config.server.port, 8765);
    EXPECT_NE(config.sandbox.security_dir.find(".stockade"), std::string::npos);
}

TEST_F(ConfigLoaderTest, ReadsFile)
{
    Write(R"({
        "logging": {"level": "debug"},
        "engine": {"host": "tcp://10.1.1.1:2375", "seccompMode": "inline"},
        "sandbox": {"image": "py:3.12", "timeoutS": 5, "memoryLimit": "128m", "securityDir": "/srv/sec"},
        "uiSandbox": {"screenWidth": 1920, "screenHeight": 1080, "allowBrowserNetwork": true},
        "server": {"port": 9000}
    })");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.engine.host, "tcp://10.1.1.1:2375");
    EXPECT_EQ(config.engine.seccomp_mode, "inline");
    EXPECT_EQ(config.sandbox.image, "py:3.12");
    EXPECT_EQ(config.sandbox.timeout_s, 5);
    EXPECT_EQ(config.sandbox.memory_limit, "128m");
    EXPECT_EQ(config.sandbox.security_dir, "/srv/sec");
    EXPECT_EQ(config.ui_sandbox.screen_width, 1920);
    EXPECT_EQ(config.ui_sandbox.screen_height, 1080);
    EXPECT_TRUE(config.ui_sandbox.allow_browser_network);
    EXPECT_EQ(config.server.port, 9000);
}

TEST_F(ConfigLoaderTest, BrokenFileKeepsDefaults)
{
    Write("{ not json");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.sandbox.timeout_s, 30);
}

TEST_F(ConfigLoaderTest, EnvironmentOverrides)
{
    Write(R"({"sandbox": {"timeoutS": 5}})");
    ::setenv("DOCKER_HOST", "tcp://docker:2375", 1);
    ::setenv("STOCKADE_SANDBOX__TIMEOUT_S", "12", 1);
    ::setenv("STOCKADE_SANDBOX_IMAGE", "custom:1", 1);
    ::setenv("STOCKADE_UI_SANDBOX__ALLOW_BROWSER_NETWORK", "yes", 1);
    ::setenv("STOCKADE_LOG_LEVEL", "warn", 1);

    auto config = LoadConfig(path);
    EXPECT_EQ(config.engine.host, "tcp://docker:2375");
    EXPECT_EQ(config.sandbox.timeout_s, 12);
    EXPECT_EQ(config.sandbox.image, "custom:1");
    EXPECT_TRUE(config.ui_sandbox.allow_browser_network);
    EXPECT_EQ(config.logging.level, "warn");

    ::setenv("STOCKADE_ENGINE__HOST", "unix:///run/user/1000/docker.sock", 1);
    config = LoadConfig(path);
    EXPECT_EQ(config.engine.host, "unix:///run/user/1000/docker.sock");
}

TEST_F(ConfigLoaderTest, ClampsRanges)
{
    Write(R"({"engine": {"maxResponseMb": 0}, "sandbox": {"timeoutS": 9999, "pidsLimit": 1},
              "uiSandbox": {"timeoutS": 1, "vncPort": 80}})");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.engine.max_response_mb, 1);
    EXPECT_EQ(config.sandbox.timeout_s, 300);
    EXPECT_EQ(config.sandbox.pids_limit, 8);
    EXPECT_EQ(config.ui_sandbox.timeout_s, 10);
    EXPECT_EQ(config.ui_sandbox.vnc_port, 1024);
}
