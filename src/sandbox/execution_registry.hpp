#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "docker/container_runtime.hpp"
#include "sandbox/input_channel.hpp"

namespace codebox::sandbox {

// Live resources of one job. The container belongs to the supervisor that
// created it; the stream is shared with the bridge that reads it.
struct SandboxHandle {
    std::string job_id;
    std::string client_id;
    std::string container_id;
    std::string workspace;
    std::shared_ptr<docker::AttachStream> stream;
    std::shared_ptr<InputChannel> input;
    std::atomic<bool> stop_requested{false};
};

// Job id -> handle. Only map operations run under the lock; callers do any
// socket or daemon work on the handle after it has been popped.
//
// Submitted jobs are also reserved here from submission until their
// supervisor returns, so a stop can reach a job that has no container yet.
class ExecutionRegistry {
public:
    // False when the id is already reserved or registered.
    bool Reserve(const std::string& job_id, const std::string& client_id);
    void Unreserve(const std::string& job_id);
    // Marks a reserved job as cancelled. False when the id is not reserved.
    bool Cancel(const std::string& job_id);
    void CancelAll();
    bool IsCancelled(const std::string& job_id) const;

    // False when the job id is already registered.
    bool Register(const std::string& job_id, std::shared_ptr<SandboxHandle> handle);
    // The only removal path. Concurrent callers for the same id: at most one
    // receives the handle.
    std::shared_ptr<SandboxHandle> PopIfPresent(const std::string& job_id);
    std::shared_ptr<SandboxHandle> Find(const std::string& job_id) const;
    // Registered and reserved ids owned by the client.
    std::vector<std::string> FindByClient(const std::string& client_id) const;
    std::vector<std::string> JobIds() const;
    bool Contains(const std::string& job_id) const;
    std::size_t Size() const;

private:
    struct Reservation {
        std::string client_id;
        bool cancelled = false;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SandboxHandle>> entries_;
    std::unordered_map<std::string, Reservation> reserved_;
};

}  // namespace codebox::sandbox
