#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "bus/event_bus.hpp"
#include "docker/container_runtime.hpp"
#include "docker/frame_codec.hpp"

namespace codebox::testing {

// Daemon side of one fake container: what the scripted program sees.
class ProgramIo {
public:
    ProgramIo(int fd, const std::atomic<bool>& killed, std::string workspace);

    bool Out(const std::string& text);
    bool Err(const std::string& text);
    // Writes raw bytes, for tests that split frames by hand.
    bool Raw(const std::string& bytes);
    // Next stdin line without its newline; nullopt on timeout, EOF or kill.
    std::optional<std::string> ReadLine(std::chrono::milliseconds timeout);
    void SleepFor(std::chrono::milliseconds duration);
    bool Killed() const { return killed_; }
    const std::string& Workspace() const { return workspace_; }

private:
    int fd_;
    const std::atomic<bool>& killed_;
    std::string workspace_;
    std::string stdin_buffer_;
};

using Program = std::function<int(ProgramIo&)>;

// In-memory ContainerRuntime. Attach hands out one end of a socketpair; the
// program runs on its own thread after Start and writes real frames to the
// other end.
class FakeRuntime : public docker::ContainerRuntime {
public:
    FakeRuntime();
    ~FakeRuntime() override;

    void SetProgram(Program program);
    void SetPingFails(bool fails) { ping_fails_ = fails; }
    void SetMissingImage(const std::string& image);
    void SetMounts(const std::string& self_id, std::vector<docker::MountPoint> mounts);

    std::vector<docker::ContainerSpec> CreatedSpecs() const;
    std::size_t CreatedCount() const;
    std::size_t LiveContainers() const;
    bool Removed(const std::string& id) const;

    void Ping() override;
    std::string Create(const docker::ContainerSpec& spec) override;
    std::shared_ptr<docker::AttachStream> Attach(const std::string& id) override;
    void Start(const std::string& id) override;
    docker::WaitResult Wait(const std::string& id, std::chrono::milliseconds timeout) override;
    void Kill(const std::string& id) override;
    void Remove(const std::string& id, bool force = true) override;
    docker::ContainerState Inspect(const std::string& id) override;
    std::vector<docker::MountPoint> Mounts(const std::string& id) override;

private:
    struct Container {
        docker::ContainerSpec spec;
        // Serializes Start against Remove so the program thread is always joined.
        std::mutex lifecycle;
        int daemon_fd = -1;
        std::thread thread;
        std::atomic<bool> started{false};
        std::atomic<bool> running{false};
        std::atomic<bool> killed{false};
        std::atomic<bool> removed{false};
        std::atomic<int> exit_code{-1};
    };

    std::shared_ptr<Container> Lookup(const std::string& id) const;
    static void Reap(Container& container);

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Container>> containers_;
    std::vector<docker::ContainerSpec> specs_;
    Program program_;
    std::set<std::string> missing_images_;
    std::string self_id_;
    std::vector<docker::MountPoint> mounts_;
    std::atomic<bool> ping_fails_{false};
    int next_id_ = 0;
};

bool WaitUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds timeout = std::chrono::seconds(5));

// Consumes events until the job's finished event (inclusive) or the timeout.
std::vector<bus::ExecutionEvent> CollectUntilFinished(bus::EventBus& bus,
                                                      const std::string& job_id,
                                                      std::chrono::milliseconds timeout = std::chrono::seconds(10));

std::string JoinedOutput(const std::vector<bus::ExecutionEvent>& events, const std::string& stream = "stdout");

}  // namespace codebox::testing
