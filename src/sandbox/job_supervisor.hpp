#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "bus/event_bus.hpp"
#include "config/config_schema.hpp"
#include "docker/container_runtime.hpp"
#include "sandbox/execution_registry.hpp"
#include "sandbox/job_error.hpp"
#include "sandbox/workspace.hpp"

namespace codebox::sandbox {

struct Job {
    std::string job_id;
    std::string client_id;
    std::string language;
    std::vector<SourceFile> files;
    // Empty: the language profile's command.
    std::string entry_command;
    // Empty / zero: the configured defaults.
    std::string mem_limit;
    std::chrono::seconds timeout{0};
};

// Closes the handle's channels, then kills and removes its container.
// Not-found and conflict answers count as success; other failures are logged.
void ReleaseSandbox(docker::ContainerRuntime& runtime, SandboxHandle& handle);

// Runs one job from provisioning to teardown on the calling thread.
class JobSupervisor {
public:
    JobSupervisor(const config::Config& config,
                  docker::ContainerRuntime& runtime,
                  ExecutionRegistry& registry,
                  bus::EventBus& bus);

    // Publishes output events while the job runs and exactly one finished
    // event at the end. Releases the job's registry reservation before that
    // event. Never throws.
    void Run(const Job& job);

private:
    struct Provisioned {
        std::unique_ptr<Workspace> workspace;
        std::string container_id;
        std::shared_ptr<docker::AttachStream> stream;
        std::shared_ptr<SandboxHandle> handle;
        bool registered = false;
    };

    bus::ExecutionEvent Execute(const Job& job, Provisioned& provisioned);
    docker::ContainerSpec BuildSpec(const Job& job,
                                    const config::LanguageProfile& profile,
                                    const Workspace& workspace) const;
    void Teardown(const Job& job, Provisioned& provisioned);

    const config::Config& config_;
    docker::ContainerRuntime& runtime_;
    ExecutionRegistry& registry_;
    bus::EventBus& bus_;
};

}  // namespace codebox::sandbox
