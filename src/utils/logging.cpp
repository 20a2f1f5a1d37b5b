#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>

namespace stockade::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config{};
    return config;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return MutableConfig();
}

void Log(const LogMessage& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (static_cast<int>(message.level) < static_cast<int>(MutableConfig().min_level)) {
        return;
    }
    std::cerr << "[" << message.tag << "] " << ToString(message.level) << " " << message.message;
    // Sorted so that repeated runs produce comparable lines.
    const std::map<std::string, std::string> sorted(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : sorted) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogMessage{.level = LogLevel::kDebug, .tag = tag, .message = message, .fields = {}});
}

void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogMessage{.level = LogLevel::kInfo, .tag = tag, .message = message, .fields = {}});
}

void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogMessage{.level = LogLevel::kWarn, .tag = tag, .message = message, .fields = {}});
}

void LogError(const std::string& tag, const std::string& message) {
    Log(LogMessage{.level = LogLevel::kError, .tag = tag, .message = message, .fields = {}});
}

}  // namespace stockade::utils
