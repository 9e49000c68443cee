#pragma once

#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace codebox::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();
bool IsEnabled(LogLevel level);

// Writes "[tag] message key=value ..." to stderr.
void Emit(const LogMessage& message);

// Stream-style builder; the line is emitted when the object goes out of scope.
//   LogLine(LogLevel::kWarn, "bridge").Field("job", id) << "write failed";
class LogLine {
public:
    LogLine(LogLevel level, std::string tag);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    LogLine& Field(const std::string& key, const std::string& value);
    LogLine& Field(const std::string& key, long long value);

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

private:
    bool enabled_;
    LogMessage message_;
    std::ostringstream stream_;
};

}  // namespace codebox::utils
