#pragma once

#include <string>

namespace stockade::config {

struct LoggingConfig {
    std::string level = "info";
};

struct EngineConfig {
    std::string host = "unix:///var/run/docker.sock";
    std::string api_version = "v1.41";
    int request_timeout_s = 60;
    // Response bodies past this size are cut off and flagged as truncated.
    int max_response_mb = 16;
    // auto | path | inline
    std::string seccomp_mode = "auto";
};

struct SandboxConfig {
    std::string image = "stockade-sandbox:latest";
    int timeout_s = 30;
    std::string memory_limit = "256m";
    double cpu_limit = 1.0;
    int pids_limit = 64;
    std::string network = "none";
    bool seccomp_enabled = true;
    std::string security_dir;
    std::string interpreter = "python";
};

struct UiSandboxConfig {
    std::string image = "stockade-ui-sandbox:latest";
    int timeout_s = 120;
    std::string memory_limit = "1g";
    double cpu_limit = 1.5;
    int pids_limit = 256;
    bool allow_browser_network = false;
    bool vnc_enabled = false;
    int vnc_port = 5900;
    int screen_width = 1280;
    int screen_height = 720;
    int screen_depth = 24;
    std::string display = ":99";
    int ready_timeout_ms = 10000;
    int ready_poll_ms = 500;
    int settle_delay_ms = 400;
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 8765;
};

struct Config {
    LoggingConfig logging;
    EngineConfig engine;
    SandboxConfig sandbox;
    UiSandboxConfig ui_sandbox;
    ServerConfig server;
};

}  // namespace stockade::config
