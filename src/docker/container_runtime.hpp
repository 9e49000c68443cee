#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace codebox::docker {

enum class ErrorKind {
    kNotFound,
    kUnavailable,
    kConflict,
    kTimeout,
    kApi
};

const char* ToString(ErrorKind kind);

class DockerError : public std::runtime_error {
public:
    DockerError(ErrorKind kind, const std::string& message, int status = 0)
        : std::runtime_error(message)
        , kind_(kind)
        , status_(status) {}

    ErrorKind Kind() const { return kind_; }
    int Status() const { return status_; }

private:
    ErrorKind kind_;
    int status_;
};

struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::string host_path;
    std::string container_path = "/app";
    std::string working_dir = "/app";
    std::optional<long long> memory_bytes;
    long long nano_cpus = 0;
    long long pids_limit = 0;
    bool network_disabled = false;
    std::map<std::string, std::string> env;
    std::map<std::string, std::string> labels;
};

struct ContainerState {
    std::string status;
    bool running = false;
    int exit_code = -1;
    bool oom_killed = false;
    std::string error;
};

struct WaitResult {
    int status_code = -1;
    std::string error;
};

struct MountPoint {
    std::string source;
    std::string destination;
};

// Hijacked stdin/stdout/stderr connection of one container.
class AttachStream {
public:
    virtual ~AttachStream() = default;

    // Descriptor to poll for readability.
    virtual int NativeHandle() const = 0;
    // Bytes that arrived together with the attach handshake.
    virtual std::string TakePending() { return {}; }
    // Returns 0 on orderly EOF; throws std::system_error on transport errors.
    virtual std::size_t ReadSome(char* data, std::size_t size) = 0;
    // Throws std::system_error (e.g. EPIPE) when the peer is gone.
    virtual void WriteAll(const std::string& data) = 0;
    // Shuts the connection down in both directions. Idempotent and safe to
    // call while another thread is polling or reading.
    virtual void Close() = 0;
};

// Blocking container-engine API. Implementations are stateless between calls
// and may be shared across threads.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual void Ping() = 0;
    virtual std::string Create(const ContainerSpec& spec) = 0;
    virtual std::shared_ptr<AttachStream> Attach(const std::string& id) = 0;
    virtual void Start(const std::string& id) = 0;
    virtual WaitResult Wait(const std::string& id, std::chrono::milliseconds timeout) = 0;
    virtual void Kill(const std::string& id) = 0;
    virtual void Remove(const std::string& id, bool force = true) = 0;
    virtual ContainerState Inspect(const std::string& id) = 0;
    virtual std::vector<MountPoint> Mounts(const std::string& id) = 0;
};

}  // namespace codebox::docker
