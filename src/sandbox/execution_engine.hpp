#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "bus/event_bus.hpp"
#include "config/config_schema.hpp"
#include "docker/container_runtime.hpp"
#include "sandbox/execution_registry.hpp"
#include "sandbox/job_supervisor.hpp"

namespace codebox::sandbox {

// Entry point for callers. Commands return immediately; every daemon call
// and socket read runs on the engine's worker pool and results arrive on
// the event bus.
class ExecutionEngine {
public:
    ExecutionEngine(config::Config config,
                    std::shared_ptr<docker::ContainerRuntime> runtime,
                    bus::EventBus& bus);
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // Pings the daemon. When unreachable the engine stays disabled and every
    // submission fails at once.
    bool Start();
    bool Available() const { return available_; }

    // False when the job was not queued. A job id that is already submitted
    // or running is refused without any event; an unavailable engine
    // publishes the failure as the job's finished event.
    bool Submit(Job job);
    void SendInput(const std::string& job_id, const std::string& text);
    void Stop(const std::string& job_id);
    void CleanupClient(const std::string& client_id);
    std::size_t ActiveJobs() const { return registry_.Size(); }
    void Shutdown();

    const config::Config& GetConfig() const { return config_; }

private:
    config::Config config_;
    std::shared_ptr<docker::ContainerRuntime> runtime_;
    bus::EventBus& bus_;
    ExecutionRegistry registry_;
    JobSupervisor supervisor_;
    boost::asio::thread_pool pool_;
    // Kill and remove for stopped jobs, kept off the job workers.
    boost::asio::thread_pool release_pool_;
    std::atomic<bool> available_{false};
    std::atomic<bool> shutdown_{false};
};

}  // namespace codebox::sandbox
