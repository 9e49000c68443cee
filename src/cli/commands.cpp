#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <poll.h>
#include <unistd.h>

#include "bus/event_bus.hpp"
#include "config/config_loader.hpp"
#include "docker/docker_client.hpp"
#include "sandbox/execution_engine.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage: codebox ping | codebox languages | "
                 "codebox run <language> <file>... [--entry CMD] [--timeout S] [--memory M]"
              << std::endl;
}

std::shared_ptr<codebox::docker::DockerClient> CreateClient(const codebox::config::Config& config) {
    return std::make_shared<codebox::docker::DockerClient>(
        config.execution.docker_socket,
        config.execution.api_version,
        std::chrono::milliseconds(config.execution.request_timeout_ms));
}

int RunPing(const codebox::config::Config& config) {
    auto client = CreateClient(config);
    try {
        client->Ping();
    } catch (const codebox::docker::DockerError& ex) {
        std::cout << "Docker daemon unreachable at " << client->SocketPath() << ": " << ex.what() << std::endl;
        return 1;
    }
    std::cout << "Docker daemon reachable at " << client->SocketPath() << std::endl;
    return 0;
}

int RunLanguages(const codebox::config::Config& config) {
    for (const auto& [name, profile] : config.languages) {
        std::cout << name << "\t" << profile.image << "\t" << profile.entry_command;
        if (!profile.installer.empty()) {
            std::cout << "\t(" << profile.installer << ")";
        }
        std::cout << std::endl;
    }
    return 0;
}

// Paths under the current directory keep their layout; anything else is
// flattened to its file name.
std::string JobPathFor(const std::filesystem::path& path) {
    const auto normal = path.lexically_normal();
    if (normal.is_relative() && !normal.empty() && *normal.begin() != "..") {
        return normal.generic_string();
    }
    return path.filename().string();
}

std::optional<std::string> ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

// Forwards terminal lines to the job until stopped or stdin closes.
void ForwardStdin(codebox::sandbox::ExecutionEngine& engine,
                  const std::string& job_id,
                  const std::atomic<bool>& running) {
    std::string pending;
    char buffer[1024];
    while (running.load()) {
        pollfd fd{};
        fd.fd = STDIN_FILENO;
        fd.events = POLLIN;
        if (::poll(&fd, 1, 200) <= 0) {
            continue;
        }
        const auto read = ::read(STDIN_FILENO, buffer, sizeof(buffer));
        if (read <= 0) {
            return;
        }
        pending.append(buffer, static_cast<std::size_t>(read));
        std::size_t newline = 0;
        while ((newline = pending.find('\n')) != std::string::npos) {
            engine.SendInput(job_id, pending.substr(0, newline));
            pending.erase(0, newline + 1);
        }
    }
}

int RunJob(const codebox::config::Config& config, int argc, char** argv) {
    if (argc < 4) {
        PrintUsage();
        return 1;
    }
    codebox::sandbox::Job job;
    job.job_id = "cli-" + std::to_string(::getpid());
    job.client_id = "cli";
    job.language = argv[2];
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--entry" && has_value) {
            job.entry_command = argv[++i];
        } else if (arg == "--timeout" && has_value) {
            try {
                job.timeout = std::chrono::seconds(std::stoi(argv[++i]));
            } catch (const std::exception&) {
                std::cout << "Invalid timeout: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--memory" && has_value) {
            job.mem_limit = argv[++i];
        } else {
            const std::filesystem::path path(arg);
            auto content = ReadFile(path);
            if (!content) {
                std::cout << "Cannot read " << arg << std::endl;
                return 1;
            }
            job.files.emplace_back(JobPathFor(path), std::move(*content));
        }
    }
    if (job.files.empty()) {
        PrintUsage();
        return 1;
    }

    codebox::bus::EventBus bus;
    codebox::sandbox::ExecutionEngine engine(config, CreateClient(config), bus);
    if (!engine.Start()) {
        std::cout << "Code execution is unavailable: cannot reach " << config.execution.docker_socket << std::endl;
        return 1;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const auto job_id = job.job_id;
    if (!engine.Submit(std::move(job))) {
        std::cerr << "job " << job_id << " was not accepted" << std::endl;
        return 1;
    }
    std::atomic<bool> running{true};
    std::thread input_thread(ForwardStdin, std::ref(engine), job_id, std::cref(running));

    int exit_code = 1;
    bool stop_sent = false;
    while (true) {
        if (g_signal != 0 && !stop_sent) {
            stop_sent = true;
            engine.Stop(job_id);
        }
        codebox::bus::ExecutionEvent event;
        if (!bus.TryConsume(event, std::chrono::milliseconds(200))) {
            continue;
        }
        if (event.kind == codebox::bus::EventKind::kOutput) {
            auto& out = event.stream == "stderr" ? std::cerr : std::cout;
            out << event.text << std::flush;
            continue;
        }
        if (event.kind == codebox::bus::EventKind::kAwaitingInput) {
            continue;
        }
        if (event.error) {
            std::cerr << "[codebox] " << *event.error << std::endl;
        }
        if (event.artifact) {
            std::cerr << "[codebox] artifact " << event.artifact->name << " (" << event.artifact->mime_type
                      << ", " << event.artifact->size << " bytes, sha256 " << event.artifact->sha256 << ")"
                      << std::endl;
        }
        exit_code = event.exit_code;
        break;
    }

    running.store(false);
    if (input_thread.joinable()) {
        input_thread.join();
    }
    engine.Shutdown();
    if (exit_code < 0 || exit_code > 255) {
        return 1;
    }
    return exit_code;
}

}  // namespace

int main(int argc, char** argv) {
    auto config = codebox::config::LoadConfig();
    codebox::utils::LogConfig log_config;
    log_config.min_level = codebox::utils::ParseLogLevel(config.log_level, codebox::utils::LogLevel::kInfo);
    codebox::utils::SetLogConfig(log_config);

    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command == "ping") {
        return RunPing(config);
    }
    if (command == "languages") {
        return RunLanguages(config);
    }
    if (command == "run") {
        return RunJob(config, argc, argv);
    }
    PrintUsage();
    return 1;
}
