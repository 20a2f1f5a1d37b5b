#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace stockade::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

void ApplyString(std::string& target, const nlohmann::json& section, const char* key) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ApplyInt(int& target, const nlohmann::json& section, const char* key) {
    if (section.contains(key) && section[key].is_number_integer()) {
        target = section[key].get<int>();
    }
}

void ApplyDouble(double& target, const nlohmann::json& section, const char* key) {
    if (section.contains(key) && section[key].is_number()) {
        target = section[key].get<double>();
    }
}

void ApplyBool(bool& target, const nlohmann::json& section, const char* key) {
    if (section.contains(key) && section[key].is_boolean()) {
        target = section[key].get<bool>();
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }

    if (data.contains("engine") && data["engine"].is_object()) {
        const auto& engine = data["engine"];
        ApplyString(config.engine.host, engine, "host");
        ApplyString(config.engine.api_version, engine, "apiVersion");
        ApplyInt(config.engine.request_timeout_s, engine, "requestTimeoutS");
        ApplyInt(config.engine.max_response_mb, engine, "maxResponseMb");
        ApplyString(config.engine.seccomp_mode, engine, "seccompMode");
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ApplyString(config.sandbox.image, sandbox, "image");
        ApplyInt(config.sandbox.timeout_s, sandbox, "timeoutS");
        ApplyString(config.sandbox.memory_limit, sandbox, "memoryLimit");
        ApplyDouble(config.sandbox.cpu_limit, sandbox, "cpuLimit");
        ApplyInt(config.sandbox.pids_limit, sandbox, "pidsLimit");
        ApplyString(config.sandbox.network, sandbox, "network");
        ApplyBool(config.sandbox.seccomp_enabled, sandbox, "seccompEnabled");
        ApplyString(config.sandbox.security_dir, sandbox, "securityDir");
        ApplyString(config.sandbox.interpreter, sandbox, "interpreter");
    }

    if (data.contains("uiSandbox") && data["uiSandbox"].is_object()) {
        const auto& ui = data["uiSandbox"];
        ApplyString(config.ui_sandbox.image, ui, "image");
        ApplyInt(config.ui_sandbox.timeout_s, ui, "timeoutS");
        ApplyString(config.ui_sandbox.memory_limit, ui, "memoryLimit");
        ApplyDouble(config.ui_sandbox.cpu_limit, ui, "cpuLimit");
        ApplyInt(config.ui_sandbox.pids_limit, ui, "pidsLimit");
        ApplyBool(config.ui_sandbox.allow_browser_network, ui, "allowBrowserNetwork");
        ApplyBool(config.ui_sandbox.vnc_enabled, ui, "vncEnabled");
        ApplyInt(config.ui_sandbox.vnc_port, ui, "vncPort");
        ApplyInt(config.ui_sandbox.screen_width, ui, "screenWidth");
        ApplyInt(config.ui_sandbox.screen_height, ui, "screenHeight");
        ApplyInt(config.ui_sandbox.screen_depth, ui, "screenDepth");
        ApplyString(config.ui_sandbox.display, ui, "display");
        ApplyInt(config.ui_sandbox.ready_timeout_ms, ui, "readyTimeoutMs");
        ApplyInt(config.ui_sandbox.ready_poll_ms, ui, "readyPollMs");
        ApplyInt(config.ui_sandbox.settle_delay_ms, ui, "settleDelayMs");
    }

    if (data.contains("server") && data["server"].is_object()) {
        ApplyString(config.server.host, data["server"], "host");
        ApplyInt(config.server.port, data["server"], "port");
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void EnvString(std::string& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = value;
    }
}

void EnvInt(int& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void EnvDouble(double& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseDouble(value, target);
    }
}

void EnvBool(bool& target, const char* primary, const char* secondary) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseBool(value);
    }
}

void ApplyEnvOverrides(Config& config) {
    EnvString(config.logging.level, "STOCKADE_LOGGING__LEVEL", "STOCKADE_LOG_LEVEL");

    const auto docker_host = GetEnv("DOCKER_HOST");
    if (!docker_host.empty()) {
        config.engine.host = docker_host;
    }
    EnvString(config.engine.host, "STOCKADE_ENGINE__HOST", "STOCKADE_ENGINE_HOST");
    EnvString(config.engine.api_version, "STOCKADE_ENGINE__API_VERSION", "STOCKADE_ENGINE_API_VERSION");
    EnvInt(config.engine.request_timeout_s,
           "STOCKADE_ENGINE__REQUEST_TIMEOUT_S", "STOCKADE_ENGINE_REQUEST_TIMEOUT_S");
    EnvInt(config.engine.max_response_mb,
           "STOCKADE_ENGINE__MAX_RESPONSE_MB", "STOCKADE_ENGINE_MAX_RESPONSE_MB");
    EnvString(config.engine.seccomp_mode, "STOCKADE_ENGINE__SECCOMP_MODE", "STOCKADE_ENGINE_SECCOMP_MODE");

    EnvString(config.sandbox.image, "STOCKADE_SANDBOX__IMAGE", "STOCKADE_SANDBOX_IMAGE");
    EnvInt(config.sandbox.timeout_s, "STOCKADE_SANDBOX__TIMEOUT_S", "STOCKADE_SANDBOX_TIMEOUT_S");
    EnvString(config.sandbox.memory_limit, "STOCKADE_SANDBOX__MEMORY_LIMIT", "STOCKADE_SANDBOX_MEMORY_LIMIT");
    EnvDouble(config.sandbox.cpu_limit, "STOCKADE_SANDBOX__CPU_LIMIT", "STOCKADE_SANDBOX_CPU_LIMIT");
    EnvInt(config.sandbox.pids_limit, "STOCKADE_SANDBOX__PIDS_LIMIT", "STOCKADE_SANDBOX_PIDS_LIMIT");
    EnvString(config.sandbox.network, "STOCKADE_SANDBOX__NETWORK", "STOCKADE_SANDBOX_NETWORK");
    EnvBool(config.sandbox.seccomp_enabled,
            "STOCKADE_SANDBOX__SECCOMP_ENABLED", "STOCKADE_SANDBOX_SECCOMP_ENABLED");
    EnvString(config.sandbox.security_dir, "STOCKADE_SANDBOX__SECURITY_DIR", "STOCKADE_SANDBOX_SECURITY_DIR");
    EnvString(config.sandbox.interpreter, "STOCKADE_SANDBOX__INTERPRETER", "STOCKADE_SANDBOX_INTERPRETER");

    EnvString(config.ui_sandbox.image, "STOCKADE_UI_SANDBOX__IMAGE", "STOCKADE_UI_SANDBOX_IMAGE");
    EnvInt(config.ui_sandbox.timeout_s, "STOCKADE_UI_SANDBOX__TIMEOUT_S", "STOCKADE_UI_SANDBOX_TIMEOUT_S");
    EnvString(config.ui_sandbox.memory_limit,
              "STOCKADE_UI_SANDBOX__MEMORY_LIMIT", "STOCKADE_UI_SANDBOX_MEMORY_LIMIT");
    EnvDouble(config.ui_sandbox.cpu_limit, "STOCKADE_UI_SANDBOX__CPU_LIMIT", "STOCKADE_UI_SANDBOX_CPU_LIMIT");
    EnvInt(config.ui_sandbox.pids_limit, "STOCKADE_UI_SANDBOX__PIDS_LIMIT", "STOCKADE_UI_SANDBOX_PIDS_LIMIT");
    EnvBool(config.ui_sandbox.allow_browser_network,
            "STOCKADE_UI_SANDBOX__ALLOW_BROWSER_NETWORK", "STOCKADE_UI_SANDBOX_ALLOW_BROWSER_NETWORK");
    EnvBool(config.ui_sandbox.vnc_enabled, "STOCKADE_UI_SANDBOX__VNC_ENABLED", "STOCKADE_UI_SANDBOX_VNC_ENABLED");
    EnvInt(config.ui_sandbox.vnc_port, "STOCKADE_UI_SANDBOX__VNC_PORT", "STOCKADE_UI_SANDBOX_VNC_PORT");
    EnvInt(config.ui_sandbox.screen_width,
           "STOCKADE_UI_SANDBOX__SCREEN_WIDTH", "STOCKADE_UI_SANDBOX_SCREEN_WIDTH");
    EnvInt(config.ui_sandbox.screen_height,
           "STOCKADE_UI_SANDBOX__SCREEN_HEIGHT", "STOCKADE_UI_SANDBOX_SCREEN_HEIGHT");
    EnvInt(config.ui_sandbox.screen_depth,
           "STOCKADE_UI_SANDBOX__SCREEN_DEPTH", "STOCKADE_UI_SANDBOX_SCREEN_DEPTH");
    EnvString(config.ui_sandbox.display, "STOCKADE_UI_SANDBOX__DISPLAY", "STOCKADE_UI_SANDBOX_DISPLAY");
    EnvInt(config.ui_sandbox.ready_timeout_ms,
           "STOCKADE_UI_SANDBOX__READY_TIMEOUT_MS", "STOCKADE_UI_SANDBOX_READY_TIMEOUT_MS");
    EnvInt(config.ui_sandbox.ready_poll_ms,
           "STOCKADE_UI_SANDBOX__READY_POLL_MS", "STOCKADE_UI_SANDBOX_READY_POLL_MS");
    EnvInt(config.ui_sandbox.settle_delay_ms,
           "STOCKADE_UI_SANDBOX__SETTLE_DELAY_MS", "STOCKADE_UI_SANDBOX_SETTLE_DELAY_MS");

    EnvString(config.server.host, "STOCKADE_SERVER__HOST", "STOCKADE_SERVER_HOST");
    EnvInt(config.server.port, "STOCKADE_SERVER__PORT", "STOCKADE_SERVER_PORT");
}

void ClampRanges(Config& config) {
    config.engine.request_timeout_s = std::clamp(config.engine.request_timeout_s, 1, 3600);
    config.engine.max_response_mb = std::clamp(config.engine.max_response_mb, 1, 1024);
    config.sandbox.timeout_s = std::clamp(config.sandbox.timeout_s, 1, 300);
    config.sandbox.cpu_limit = std::clamp(config.sandbox.cpu_limit, 0.1, 8.0);
    config.sandbox.pids_limit = std::clamp(config.sandbox.pids_limit, 8, 512);
    config.ui_sandbox.timeout_s = std::clamp(config.ui_sandbox.timeout_s, 10, 600);
    config.ui_sandbox.cpu_limit = std::clamp(config.ui_sandbox.cpu_limit, 0.1, 8.0);
    config.ui_sandbox.pids_limit = std::clamp(config.ui_sandbox.pids_limit, 8, 1024);
    config.ui_sandbox.vnc_port = std::clamp(config.ui_sandbox.vnc_port, 1024, 65535);
    config.ui_sandbox.ready_timeout_ms = std::max(config.ui_sandbox.ready_timeout_ms, 0);
    config.ui_sandbox.ready_poll_ms = std::max(config.ui_sandbox.ready_poll_ms, 10);
    config.ui_sandbox.settle_delay_ms = std::max(config.ui_sandbox.settle_delay_ms, 0);
}

}  // namespace

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto override_path = GetEnv("STOCKADE_CONFIG");
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    return GetHomePath() / ".stockade" / "config.json";
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        std::ifstream input(config_path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            // Keep defaults on parse errors
            utils::LogWarn("config", "ignoring unparsable config file " + config_path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvOverrides(config);

    if (config.sandbox.security_dir.empty()) {
        config.sandbox.security_dir = (GetHomePath() / ".stockade" / "security").string();
    }
    ClampRanges(config);
    return config;
}

}  // namespace stockade::config
