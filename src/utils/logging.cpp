#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace codebox::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_sink_mutex;

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
    g_min_level = static_cast<int>(config.min_level);
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = static_cast<LogLevel>(g_min_level.load());
    return config;
}

bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Emit(const LogMessage& message) {
    if (!IsEnabled(message.level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << message.tag << "]";
    if (message.level != LogLevel::kInfo) {
        line << " " << ToString(message.level);
    }
    if (!message.message.empty()) {
        line << " " << message.message;
    }
    for (const auto& [key, value] : message.fields) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    std::cerr << line.str() << std::endl;
}

LogLine::LogLine(LogLevel level, std::string tag)
    : enabled_(IsEnabled(level)) {
    message_.level = level;
    message_.tag = std::move(tag);
}

LogLine::~LogLine() {
    if (!enabled_) {
        return;
    }
    message_.message = stream_.str();
    Emit(message_);
}

LogLine& LogLine::Field(const std::string& key, const std::string& value) {
    if (enabled_) {
        message_.fields.emplace_back(key, value.empty() ? std::string("(empty)") : value);
    }
    return *this;
}

LogLine& LogLine::Field(const std::string& key, long long value) {
    if (enabled_) {
        message_.fields.emplace_back(key, std::to_string(value));
    }
    return *this;
}

}  // namespace codebox::utils
