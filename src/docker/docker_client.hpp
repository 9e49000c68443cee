#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/http/verb.hpp>

#include "docker/container_runtime.hpp"

namespace codebox::docker {

// Docker Engine API over the daemon's unix socket. Each call opens its own
// connection, so one client can be shared by every job.
class DockerClient : public ContainerRuntime {
public:
    explicit DockerClient(std::string socket_path,
                          std::string api_version = "v1.41",
                          std::chrono::milliseconds request_timeout = std::chrono::seconds(30));

    void Ping() override;
    std::string Create(const ContainerSpec& spec) override;
    std::shared_ptr<AttachStream> Attach(const std::string& id) override;
    void Start(const std::string& id) override;
    WaitResult Wait(const std::string& id, std::chrono::milliseconds timeout) override;
    void Kill(const std::string& id) override;
    void Remove(const std::string& id, bool force = true) override;
    ContainerState Inspect(const std::string& id) override;
    std::vector<MountPoint> Mounts(const std::string& id) override;

    const std::string& SocketPath() const { return socket_path_; }

private:
    struct HttpResult {
        int status = 0;
        std::string body;
    };

    HttpResult Request(boost::beast::http::verb verb,
                       const std::string& target,
                       const std::string& body,
                       std::chrono::milliseconds timeout) const;
    HttpResult Request(boost::beast::http::verb verb,
                       const std::string& target,
                       const std::string& body = {}) const;
    std::string Versioned(const std::string& target) const;

    std::string socket_path_;
    std::string api_prefix_;
    std::chrono::milliseconds request_timeout_;
};

}  // namespace codebox::docker
