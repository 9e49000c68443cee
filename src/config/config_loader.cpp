#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::config {
namespace {

using codebox::utils::GetEnv;
using codebox::utils::LogLevel;
using codebox::utils::LogLine;

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

bool ParseBool(const std::string& value) {
    const auto lowered = codebox::utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

long long ParseLong(const std::string& value, long long fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadLong(const nlohmann::json& source, const char* key, long long& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<long long>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ReadStringMap(const nlohmann::json& source, const char* key,
                   std::map<std::string, std::string>& target) {
    if (!source.contains(key) || !source[key].is_object()) {
        return;
    }
    for (const auto& item : source[key].items()) {
        if (item.value().is_string()) {
            target[item.key()] = item.value().get<std::string>();
        }
    }
}

void ApplyLanguageProfile(LanguageProfile& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    ReadString(source, "image", target.image);
    ReadString(source, "command", target.entry_command);
    ReadString(source, "installer", target.installer);
    ReadStringMap(source, "env", target.env);
}

std::filesystem::path DefaultWorkspaceRoot() {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    return base / "codebox";
}

// DOCKER_HOST=unix:///path/to/docker.sock
std::string SocketFromDockerHost(const std::string& docker_host) {
    const std::string prefix = "unix://";
    if (docker_host.rfind(prefix, 0) != 0) {
        return {};
    }
    return docker_host.substr(prefix.size());
}

}  // namespace

std::map<std::string, LanguageProfile> DefaultLanguages() {
    std::map<std::string, LanguageProfile> languages;
    languages["python"] = {
        "python:3.11-slim",
        "python -u main.py",
        "pip",
        {{"PYTHONUNBUFFERED", "1"}, {"PIP_ROOT_USER_ACTION", "ignore"}}};
    languages["javascript"] = {"node:18-alpine", "node main.js", "", {}};
    languages["typescript"] = {
        "node:18-alpine",
        "npx --yes -p typescript tsc --module commonjs main.ts && node main.js",
        "",
        {}};
    languages["cpp"] = {
        "gcc:latest",
        "g++ -std=c++17 -O2 main.cpp -o main_app && ./main_app",
        "",
        {}};
    languages["c"] = {"gcc:latest", "gcc -O2 main.c -o main_app && ./main_app", "", {}};
    languages["java"] = {"openjdk:17-jdk-slim", "javac Main.java && java -cp . Main", "", {}};
    languages["go"] = {"golang:1.21-alpine", "go run main.go", "", {}};
    languages["rust"] = {"rust:1-slim", "rustc main.rs -o main_app && ./main_app", "", {}};
    languages["csharp"] = {
        "mcr.microsoft.com/dotnet/sdk:latest",
        "mv Program.cs .user_program && dotnet new console --force -o . >/dev/null"
        " && mv .user_program Program.cs && dotnet run",
        "",
        {{"DOTNET_CLI_TELEMETRY_OPTOUT", "1"}}};
    return languages;
}

Config DefaultConfig() {
    Config config{};
    config.execution.workspace_root = DefaultWorkspaceRoot().string();
    config.languages = DefaultLanguages();
    return config;
}

std::filesystem::path GetConfigPath() {
    const auto override_path = GetEnv("CODEBOX_CONFIG");
    if (!override_path.empty()) {
        return override_path;
    }
    return codebox::utils::GetHomePath() / ".codebox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    ReadString(data, "logLevel", config.log_level);

    if (data.contains("execution") && data["execution"].is_object()) {
        const auto& execution = data["execution"];
        auto& target = config.execution;
        ReadString(execution, "dockerSocket", target.docker_socket);
        ReadString(execution, "apiVersion", target.api_version);
        ReadString(execution, "workspaceRoot", target.workspace_root);
        ReadString(execution, "containerWorkdir", target.container_workdir);
        ReadInt(execution, "timeoutS", target.timeout_s);
        ReadString(execution, "memLimit", target.mem_limit);
        ReadLong(execution, "nanoCpus", target.nano_cpus);
        ReadLong(execution, "pidsLimit", target.pids_limit);
        ReadBool(execution, "networkDisabled", target.network_disabled);
        ReadInt(execution, "idleTickMs", target.idle_tick_ms);
        ReadInt(execution, "drainTimeoutMs", target.drain_timeout_ms);
        ReadInt(execution, "requestTimeoutMs", target.request_timeout_ms);
        ReadInt(execution, "workerThreads", target.worker_threads);
        ReadBool(execution, "translateHostPaths", target.translate_host_paths);
        ReadString(execution, "artifactPath", target.artifact_path);
        ReadLong(execution, "artifactMaxBytes", target.artifact_max_bytes);
        ReadStringMap(execution, "labels", target.labels);
    }

    if (data.contains("languages") && data["languages"].is_object()) {
        for (const auto& item : data["languages"].items()) {
            const auto key = codebox::utils::ToLower(item.key());
            if (item.value().is_null()) {
                config.languages.erase(key);
                continue;
            }
            ApplyLanguageProfile(config.languages[key], item.value());
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    auto& execution = config.execution;

    const auto docker_host = SocketFromDockerHost(GetEnv("DOCKER_HOST"));
    if (!docker_host.empty()) {
        execution.docker_socket = docker_host;
    }

    const auto docker_socket = GetEnvFallback(
        "CODEBOX_EXECUTION__DOCKER_SOCKET",
        "CODEBOX_DOCKER_SOCKET");
    if (!docker_socket.empty()) {
        execution.docker_socket = docker_socket;
    }

    const auto workspace_root = GetEnvFallback(
        "CODEBOX_EXECUTION__WORKSPACE_ROOT",
        "CODEBOX_WORKSPACE_ROOT");
    if (!workspace_root.empty()) {
        execution.workspace_root = workspace_root;
    }

    const auto timeout = GetEnvFallback(
        "CODEBOX_EXECUTION__TIMEOUT_S",
        "CODEBOX_TIMEOUT_S");
    if (!timeout.empty()) {
        execution.timeout_s = ParseInt(timeout, execution.timeout_s);
    }

    const auto mem_limit = GetEnvFallback(
        "CODEBOX_EXECUTION__MEM_LIMIT",
        "CODEBOX_MEM_LIMIT");
    if (!mem_limit.empty()) {
        execution.mem_limit = mem_limit;
    }

    const auto nano_cpus = GetEnvFallback(
        "CODEBOX_EXECUTION__NANO_CPUS",
        "CODEBOX_NANO_CPUS");
    if (!nano_cpus.empty()) {
        execution.nano_cpus = ParseLong(nano_cpus, execution.nano_cpus);
    }

    const auto pids_limit = GetEnvFallback(
        "CODEBOX_EXECUTION__PIDS_LIMIT",
        "CODEBOX_PIDS_LIMIT");
    if (!pids_limit.empty()) {
        execution.pids_limit = ParseLong(pids_limit, execution.pids_limit);
    }

    const auto network_disabled = GetEnvFallback(
        "CODEBOX_EXECUTION__NETWORK_DISABLED",
        "CODEBOX_NETWORK_DISABLED");
    if (!network_disabled.empty()) {
        execution.network_disabled = ParseBool(network_disabled);
    }

    const auto idle_tick = GetEnvFallback(
        "CODEBOX_EXECUTION__IDLE_TICK_MS",
        "CODEBOX_IDLE_TICK_MS");
    if (!idle_tick.empty()) {
        execution.idle_tick_ms = ParseInt(idle_tick, execution.idle_tick_ms);
    }

    const auto workers = GetEnvFallback(
        "CODEBOX_EXECUTION__WORKER_THREADS",
        "CODEBOX_WORKER_THREADS");
    if (!workers.empty()) {
        execution.worker_threads = ParseInt(workers, execution.worker_threads);
    }

    const auto translate = GetEnvFallback(
        "CODEBOX_EXECUTION__TRANSLATE_HOST_PATHS",
        "CODEBOX_TRANSLATE_HOST_PATHS");
    if (!translate.empty()) {
        execution.translate_host_paths = ParseBool(translate);
    }

    const auto log_level = GetEnv("CODEBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }
}

Config LoadConfig() {
    Config config = DefaultConfig();

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            LogLine(LogLevel::kWarn, "config").Field("path", config_path.string())
                << "keeping defaults, parse error: " << ex.what();
        }
    }

    ApplyConfigFromEnv(config);

    if (config.execution.worker_threads < 1) {
        config.execution.worker_threads = 1;
    }
    if (config.execution.idle_tick_ms < 10) {
        config.execution.idle_tick_ms = 10;
    }
    return config;
}

std::optional<long long> ParseMemoryLimit(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    std::size_t digits = 0;
    while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        return std::nullopt;
    }
    long long amount = 0;
    try {
        amount = std::stoll(value.substr(0, digits));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    auto suffix = codebox::utils::ToLower(value.substr(digits));
    if (!suffix.empty() && suffix.back() == 'b') {
        suffix.pop_back();
    }
    long long multiplier = 1;
    if (suffix.empty()) {
        multiplier = 1;
    } else if (suffix == "k") {
        multiplier = 1024LL;
    } else if (suffix == "m") {
        multiplier = 1024LL * 1024;
    } else if (suffix == "g") {
        multiplier = 1024LL * 1024 * 1024;
    } else {
        return std::nullopt;
    }
    return amount * multiplier;
}

const LanguageProfile* FindLanguage(const Config& config, const std::string& language) {
    auto key = codebox::utils::ToLower(language);
    if (key == "py" || key == "python3") {
        key = "python";
    } else if (key == "js" || key == "node") {
        key = "javascript";
    } else if (key == "ts") {
        key = "typescript";
    } else if (key == "c++" || key == "cxx") {
        key = "cpp";
    } else if (key == "c#" || key == "cs") {
        key = "csharp";
    }
    const auto it = config.languages.find(key);
    if (it == config.languages.end() || it->second.image.empty()) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace codebox::config
