#include "sandbox/job_supervisor.hpp"

#include <filesystem>
#include <future>
#include <optional>
#include <system_error>

#include "config/config_loader.hpp"
#include "docker/host_path.hpp"
#include "sandbox/artifact.hpp"
#include "sandbox/dependency_scanner.hpp"
#include "sandbox/io_bridge.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace {

using codebox::utils::LogLevel;
using codebox::utils::LogLine;

constexpr int kTimeoutExitCode = 124;
constexpr const char* kTimeoutMessage = "Execution timed out.";
constexpr const char* kStoppedMessage = "Execution stopped by user.";

bool IsBenign(const docker::DockerError& ex) {
    return ex.Kind() == docker::ErrorKind::kNotFound || ex.Kind() == docker::ErrorKind::kConflict;
}

void KillAndRemove(docker::ContainerRuntime& runtime, const std::string& container_id) {
    if (container_id.empty()) {
        return;
    }
    try {
        runtime.Kill(container_id);
    } catch (const docker::DockerError& ex) {
        if (!IsBenign(ex)) {
            LogLine(LogLevel::kWarn, "supervisor").Field("container", codebox::utils::ShortId(container_id))
                << "kill failed: " << ex.what();
        }
    }
    try {
        runtime.Remove(container_id, true);
    } catch (const docker::DockerError& ex) {
        if (!IsBenign(ex)) {
            LogLine(LogLevel::kWarn, "supervisor").Field("container", codebox::utils::ShortId(container_id))
                << "remove failed: " << ex.what();
        }
    }
}

}  // namespace

void ReleaseSandbox(docker::ContainerRuntime& runtime, SandboxHandle& handle) {
    if (handle.input) {
        handle.input->Close();
    }
    if (handle.stream) {
        handle.stream->Close();
    }
    KillAndRemove(runtime, handle.container_id);
    LogLine(LogLevel::kDebug, "supervisor").Field("job", handle.job_id)
        .Field("container", codebox::utils::ShortId(handle.container_id)) << "sandbox released";
}

JobSupervisor::JobSupervisor(const config::Config& config,
                             docker::ContainerRuntime& runtime,
                             ExecutionRegistry& registry,
                             bus::EventBus& bus)
    : config_(config)
    , runtime_(runtime)
    , registry_(registry)
    , bus_(bus) {}

void JobSupervisor::Run(const Job& job) {
    Provisioned provisioned;
    std::optional<bus::ExecutionEvent> finished;
    auto fail = [&](const std::string& message) {
        const bool stopped = (provisioned.handle && provisioned.handle->stop_requested)
            || registry_.IsCancelled(job.job_id);
        if (stopped) {
            return bus::MakeFinished(job.job_id, job.client_id, -1, std::string(kStoppedMessage));
        }
        return bus::MakeFinished(job.job_id, job.client_id, -1, message);
    };

    try {
        finished = Execute(job, provisioned);
    } catch (const JobError& ex) {
        if (ex.Kind() == JobErrorKind::kCancelled) {
            LogLine(LogLevel::kInfo, "supervisor").Field("job", job.job_id) << "stopped before start";
        } else {
            LogLine(LogLevel::kWarn, "supervisor").Field("job", job.job_id) << ex.what();
        }
        finished = fail(ex.what());
    } catch (const docker::DockerError& ex) {
        LogLine(LogLevel::kError, "supervisor").Field("job", job.job_id)
            .Field("kind", docker::ToString(ex.Kind())) << ex.what();
        finished = fail(ex.what());
    } catch (const std::exception& ex) {
        LogLine(LogLevel::kError, "supervisor").Field("job", job.job_id) << "unexpected: " << ex.what();
        finished = fail(std::string("Execution failed: ") + ex.what());
    }

    Teardown(job, provisioned);
    registry_.Unreserve(job.job_id);
    LogLine(LogLevel::kInfo, "supervisor").Field("job", job.job_id)
        .Field("exit", static_cast<long long>(finished->exit_code)) << "finished";
    bus_.Publish(*finished);
}

bus::ExecutionEvent JobSupervisor::Execute(const Job& job, Provisioned& provisioned) {
    const auto& execution = config_.execution;
    const auto* profile = config::FindLanguage(config_, job.language);
    if (!profile) {
        throw JobError(JobErrorKind::kConfiguration,
                       "Language '" + job.language + "' not supported for execution.");
    }
    if (registry_.Contains(job.job_id)) {
        throw JobError(JobErrorKind::kConfiguration, "Job '" + job.job_id + "' is already running.");
    }
    if (registry_.IsCancelled(job.job_id)) {
        throw JobError(JobErrorKind::kCancelled, kStoppedMessage);
    }

    provisioned.workspace = std::make_unique<Workspace>(
        std::filesystem::absolute(execution.workspace_root), job.job_id, job.files);
    const auto spec = BuildSpec(job, *profile, *provisioned.workspace);

    provisioned.container_id = runtime_.Create(spec);
    provisioned.stream = runtime_.Attach(provisioned.container_id);

    auto handle = std::make_shared<SandboxHandle>();
    handle->job_id = job.job_id;
    handle->client_id = job.client_id;
    handle->container_id = provisioned.container_id;
    handle->workspace = provisioned.workspace->Path().string();
    handle->stream = provisioned.stream;
    handle->input = std::make_shared<InputChannel>();
    if (!registry_.Register(job.job_id, handle)) {
        throw JobError(JobErrorKind::kConfiguration, "Job '" + job.job_id + "' is already running.");
    }
    provisioned.handle = handle;
    provisioned.registered = true;
    // A stop that arrived while provisioning found nothing to pop; honor it here.
    if (registry_.IsCancelled(job.job_id)) {
        handle->stop_requested = true;
        throw JobError(JobErrorKind::kCancelled, kStoppedMessage);
    }

    runtime_.Start(provisioned.container_id);
    LogLine(LogLevel::kInfo, "supervisor").Field("job", job.job_id)
        .Field("container", codebox::utils::ShortId(provisioned.container_id))
        .Field("image", spec.image) << "started";

    BridgeCallbacks callbacks;
    callbacks.on_output = [this, &job](docker::StreamType stream, const std::string& text) {
        bus_.Publish(bus::MakeOutput(job.job_id, job.client_id, docker::ToString(stream), text));
    };
    callbacks.on_awaiting_input = [this, &job]() {
        bus_.Publish(bus::MakeAwaitingInput(job.job_id, job.client_id));
    };
    BridgeOptions options;
    options.idle_tick = std::chrono::milliseconds(execution.idle_tick_ms);
    options.drain_timeout = std::chrono::milliseconds(execution.drain_timeout_ms);

    auto bridge = std::make_shared<InteractiveBridge>(
        runtime_, provisioned.container_id, provisioned.stream, handle->input, std::move(callbacks), options);
    auto running = std::async(std::launch::async, [bridge]() { return bridge->Run(); });

    const auto timeout = job.timeout.count() > 0 ? job.timeout : std::chrono::seconds(execution.timeout_s);
    if (running.wait_for(timeout) == std::future_status::timeout) {
        LogLine(LogLevel::kWarn, "supervisor").Field("job", job.job_id)
            .Field("timeout_s", static_cast<long long>(timeout.count())) << "timed out, killing";
        if (auto popped = registry_.PopIfPresent(job.job_id)) {
            ReleaseSandbox(runtime_, *popped);
        }
        try {
            running.get();
        } catch (const std::exception& ex) {
            LogLine(LogLevel::kWarn, "supervisor").Field("job", job.job_id) << "bridge failed: " << ex.what();
        }
        if (handle->stop_requested) {
            return bus::MakeFinished(job.job_id, job.client_id, -1, std::string(kStoppedMessage));
        }
        return bus::MakeFinished(job.job_id, job.client_id, kTimeoutExitCode, std::string(kTimeoutMessage));
    }

    const auto result = running.get();
    if (handle->stop_requested) {
        return bus::MakeFinished(job.job_id, job.client_id, -1, std::string(kStoppedMessage));
    }
    if (result.transport_failed) {
        LogLine(LogLevel::kWarn, "supervisor").Field("job", job.job_id)
            << "attach stream failed mid-execution, reporting recovered exit code";
    }
    std::optional<std::string> error;
    if (!result.error.empty()) {
        error = result.error;
    }
    auto artifact = CollectArtifact(provisioned.workspace->Path(), execution.artifact_path,
                                    static_cast<std::size_t>(execution.artifact_max_bytes));
    return bus::MakeFinished(job.job_id, job.client_id, result.exit_code, std::move(error), std::move(artifact));
}

docker::ContainerSpec JobSupervisor::BuildSpec(const Job& job,
                                               const config::LanguageProfile& profile,
                                               const Workspace& workspace) const {
    const auto& execution = config_.execution;
    auto entry = job.entry_command.empty() ? profile.entry_command : job.entry_command;
    if (entry.empty()) {
        throw JobError(JobErrorKind::kConfiguration,
                       "No entry command configured for language '" + job.language + "'.");
    }
    if (profile.installer == "pip") {
        entry = WrapWithInstall(ScanPythonDependencies(job.files), entry);
    }

    const auto& limit = job.mem_limit.empty() ? execution.mem_limit : job.mem_limit;
    std::optional<long long> memory;
    if (!limit.empty()) {
        memory = config::ParseMemoryLimit(limit);
        if (!memory) {
            throw JobError(JobErrorKind::kConfiguration, "Invalid memory limit '" + limit + "'.");
        }
    }

    const auto local_path = workspace.Path().string();
    docker::ContainerSpec spec;
    spec.name = "codebox-" + workspace.Path().filename().string();
    spec.image = profile.image;
    spec.command = {"sh", "-c", entry};
    spec.host_path = execution.translate_host_paths
        ? docker::TranslateToHostPath(runtime_, local_path)
        : local_path;
    spec.container_path = execution.container_workdir;
    spec.working_dir = execution.container_workdir;
    spec.memory_bytes = memory;
    spec.nano_cpus = execution.nano_cpus;
    spec.pids_limit = execution.pids_limit;
    spec.network_disabled = execution.network_disabled;
    spec.env = profile.env;
    spec.labels = execution.labels;
    spec.labels["codebox.job-id"] = job.job_id;
    if (!job.client_id.empty()) {
        spec.labels["codebox.client-id"] = job.client_id;
    }
    return spec;
}

void JobSupervisor::Teardown(const Job& job, Provisioned& provisioned) {
    if (provisioned.registered) {
        // A concurrent Stop that popped first owns the container teardown.
        if (auto handle = registry_.PopIfPresent(job.job_id)) {
            ReleaseSandbox(runtime_, *handle);
        }
    } else if (!provisioned.container_id.empty()) {
        if (provisioned.stream) {
            provisioned.stream->Close();
        }
        KillAndRemove(runtime_, provisioned.container_id);
    }
    if (provisioned.workspace) {
        provisioned.workspace->Remove();
    }
}

}  // namespace codebox::sandbox
