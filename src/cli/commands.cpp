#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include "config/config_loader.hpp"
#include "sandbox/code_executor.hpp"
#include "sandbox/docker_engine.hpp"
#include "sandbox/security_policy.hpp"
#include "sandbox/ui_executor.hpp"
#include "utils/logging.hpp"
#include "utils/shutdown_guard.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

constexpr int kTimeoutExit = 124;
// Time allowed for the HTTP thread to wind down after a signal.
constexpr std::chrono::seconds kShutdownGrace{5};

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

stockade::config::Config LoadAndApplyConfig() {
    auto config = stockade::config::LoadConfig();
    stockade::utils::LogConfig log_config{};
    log_config.min_level = stockade::utils::ParseLogLevel(config.logging.level, stockade::utils::LogLevel::kInfo);
    stockade::utils::SetLogConfig(log_config);
    return config;
}

bool ReadSource(const std::string& source, std::string& content) {
    if (source == "-") {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    content = buffer.str();
    return true;
}

int RunCode(const std::string& source) {
    std::string code;
    if (!ReadSource(source, code)) {
        std::cerr << "Cannot read " << source << std::endl;
        return 1;
    }
    const auto config = LoadAndApplyConfig();
    auto engine = std::make_shared<stockade::sandbox::DockerEngine>(config.engine);
    auto executor = stockade::sandbox::CreateCodeExecutor(config, engine);
    executor->runtime().VerifyImage();

    const auto result = executor->Execute(code);
    std::cout << result.stdout_text;
    std::cerr << result.stderr_text;
    if (!result.error.empty()) {
        std::cerr << "[run] " << result.error << std::endl;
    }
    if (result.failure == stockade::sandbox::FailureKind::kTimeout ||
        result.failure == stockade::sandbox::FailureKind::kRuntimeFailure) {
        return kTimeoutExit;
    }
    return result.exit_code;
}

int RunUiScript(const std::string& path) {
    std::string text;
    if (!ReadSource(path, text)) {
        std::cerr << "Cannot read " << path << std::endl;
        return 1;
    }
    const auto actions = nlohmann::json::parse(text, nullptr, false);
    if (actions.is_discarded() || !actions.is_array()) {
        std::cerr << "Expected a JSON array of actions in " << path << std::endl;
        return 1;
    }

    std::vector<stockade::sandbox::UIAction> parsed;
    try {
        for (const auto& item : actions) {
            parsed.push_back(stockade::sandbox::ParseUiAction(item));
        }
    } catch (const std::exception& ex) {
        std::cerr << "Invalid action: " << ex.what() << std::endl;
        return 1;
    }

    const auto config = LoadAndApplyConfig();
    auto engine = std::make_shared<stockade::sandbox::DockerEngine>(config.engine);
    auto executor = stockade::sandbox::CreateUiExecutor(config, engine);
    stockade::sandbox::UiSession session(*executor);
    if (session->state() == stockade::sandbox::ExecutorState::kStopped) {
        std::cerr << "[ui] " << session->StartupError() << std::endl;
        return 1;
    }

    bool all_ok = true;
    for (const auto& action : parsed) {
        const auto result = session->Act(action);
        all_ok = all_ok && result.success;
        std::cout << stockade::sandbox::ToJson(result, false).dump() << std::endl;
    }
    return all_ok ? 0 : 1;
}

int PrintSeccompProfile() {
    std::cout << stockade::sandbox::BuildSeccompProfile().dump(2) << std::endl;
    return 0;
}

int CheckImages() {
    const auto config = LoadAndApplyConfig();
    auto engine = std::make_shared<stockade::sandbox::DockerEngine>(config.engine);
    bool ok = true;
    for (const auto& image : {config.sandbox.image, config.ui_sandbox.image}) {
        stockade::sandbox::ContainerRuntime runtime(engine, image, stockade::sandbox::SecurityPolicy());
        const bool present = runtime.VerifyImage();
        std::cout << image << ": " << (present ? "present" : "missing") << std::endl;
        ok = ok && present;
    }
    std::cout << "seccomp encoding: "
              << stockade::sandbox::ToString(stockade::sandbox::DetectSeccompEncoding(config.engine)) << std::endl;
    return ok ? 0 : 1;
}

void SetJson(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

int RunServer() {
    const auto config = LoadAndApplyConfig();
    auto engine = std::make_shared<stockade::sandbox::DockerEngine>(config.engine);

    std::mutex ui_mutex;
    std::unique_ptr<stockade::sandbox::UIExecutor> ui_executor;
    // Caller holds ui_mutex.
    auto ensure_ui = [&]() -> stockade::sandbox::UIExecutor* {
        if (!ui_executor) {
            ui_executor = stockade::sandbox::CreateUiExecutor(config, engine);
        }
        if (ui_executor->state() == stockade::sandbox::ExecutorState::kStopped && !ui_executor->Start()) {
            return nullptr;
        }
        return ui_executor.get();
    };

    httplib::Server http_server;
    http_server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        SetJson(res, {{"status", "ok"}});
    });

    // Execute() is safe to call concurrently; every call gets its own container.
    auto code_executor = stockade::sandbox::CreateCodeExecutor(config, engine);
    code_executor->runtime().VerifyImage();

    http_server.Post("/execute", [&code_executor](const httplib::Request& req, httplib::Response& res) {
        const auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object() || !body.contains("code") || !body["code"].is_string()) {
            SetJson(res, {{"error", "expected {\"code\": string}"}}, 400);
            return;
        }
        SetJson(res, stockade::sandbox::ToJson(code_executor->Execute(body["code"].get<std::string>())));
    });

    http_server.Post("/ui/act", [&ui_mutex, &ensure_ui](const httplib::Request& req, httplib::Response& res) {
        const auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded()) {
            SetJson(res, {{"error", "invalid JSON"}}, 400);
            return;
        }
        stockade::sandbox::UIAction action{};
        try {
            action = stockade::sandbox::ParseUiAction(body);
        } catch (const std::exception& ex) {
            SetJson(res, {{"error", ex.what()}}, 400);
            return;
        }
        std::lock_guard<std::mutex> lock(ui_mutex);
        auto* executor = ensure_ui();
        if (!executor) {
            SetJson(res, {{"error", "UI sandbox unavailable"}}, 503);
            return;
        }
        SetJson(res, stockade::sandbox::ToJson(executor->Act(action)));
    });

    http_server.Get("/ui/state", [&ui_mutex, &ensure_ui](const httplib::Request&, httplib::Response& res) {
        std::lock_guard<std::mutex> lock(ui_mutex);
        auto* executor = ensure_ui();
        if (!executor) {
            SetJson(res, {{"error", "UI sandbox unavailable"}}, 503);
            return;
        }
        auto state = stockade::sandbox::ToJson(executor->GetGuiState());
        state["display_ready"] = executor->DisplayReady();
        SetJson(res, state);
    });

    InstallSignalHandlers();

    const std::string host = config.server.host;
    const int port = config.server.port;
    std::atomic<bool> http_done{false};
    std::thread http_thread([&http_server, &http_done, host, port]() {
        const bool ok = http_server.listen(host, port);
        if (!ok) {
            std::cerr << "[serve] http server failed to listen on " << host << ":" << port << std::endl;
            g_running.store(false);
        }
        http_done.store(true);
    });

    std::cout << "stockade serving on " << host << ":" << port << ". Press Ctrl+C to stop." << std::endl;
    while (g_running.load()) {
        if (g_signal != 0) {
            g_running.store(false);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // stop() is a no-op until listen() has bound, so it is repeated until
    // the HTTP thread leaves listen(). The guard bounds the wait.
    stockade::utils::ShutdownGuard guard;
    guard.Arm(kShutdownGrace, []() {
        std::cerr << "[serve] http server did not stop, exiting" << std::endl;
        std::_Exit(130);
    });
    while (!http_done.load()) {
        http_server.stop();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (http_thread.joinable()) {
        http_thread.join();
    }
    guard.Disarm();
    std::lock_guard<std::mutex> lock(ui_mutex);
    if (ui_executor) {
        ui_executor->Stop();
    }
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: stockade run <file|-> | stockade ui <actions.json> | stockade seccomp"
              << " | stockade check | stockade serve" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    try {
        if (command == "run" && argc >= 3) {
            return RunCode(argv[2]);
        }
        if (command == "ui" && argc >= 3) {
            return RunUiScript(argv[2]);
        }
        if (command == "seccomp") {
            return PrintSeccompProfile();
        }
        if (command == "check") {
            return CheckImages();
        }
        if (command == "serve") {
            return RunServer();
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    PrintUsage();
    return 1;
}
