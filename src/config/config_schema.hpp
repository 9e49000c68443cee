#pragma once

#include <map>
#include <string>
#include <vector>

namespace codebox::config {

struct LanguageProfile {
    std::string image;
    std::string entry_command;
    // "pip" scans Python imports and installs them before the entry command.
    std::string installer;
    std::map<std::string, std::string> env;
};

struct ExecutionConfig {
    std::string docker_socket = "/var/run/docker.sock";
    std::string api_version = "v1.41";
    std::string workspace_root;
    std::string container_workdir = "/app";
    int timeout_s = 30;
    std::string mem_limit = "128m";
    long long nano_cpus = 0;
    long long pids_limit = 0;
    bool network_disabled = false;
    int idle_tick_ms = 1000;
    int drain_timeout_ms = 2000;
    int request_timeout_ms = 30000;
    int worker_threads = 4;
    bool translate_host_paths = true;
    std::string artifact_path = ".codebox/plot.png";
    long long artifact_max_bytes = 5 * 1024 * 1024;
    std::map<std::string, std::string> labels = {{"managed-by", "codebox"}};
};

struct Config {
    ExecutionConfig execution;
    std::map<std::string, LanguageProfile> languages;
    std::string log_level = "info";
};

}  // namespace codebox::config
