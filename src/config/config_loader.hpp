#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace codebox::config {

// Defaults, then ~/.codebox/config.json (or $CODEBOX_CONFIG), then environment.
Config LoadConfig();

Config DefaultConfig();
std::map<std::string, LanguageProfile> DefaultLanguages();
void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);
std::filesystem::path GetConfigPath();

// "128m", "1g", "512k", "1048576" -> bytes.
std::optional<long long> ParseMemoryLimit(const std::string& value);

// Case-insensitive profile lookup with the usual aliases (py, js, ts, c++).
const LanguageProfile* FindLanguage(const Config& config, const std::string& language);

}  // namespace codebox::config
