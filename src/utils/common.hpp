#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace codebox::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

inline std::string ShortId(const std::string& id) {
    return id.size() > 12 ? id.substr(0, 12) : id;
}

}  // namespace codebox::utils
