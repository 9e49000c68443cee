#include "docker/docker_client.hpp"

#include <atomic>
#include <system_error>
#include <utility>
#include <sys/socket.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::docker {
namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;

using UnixSocket = asio::local::stream_protocol::socket;
using UnixEndpoint = asio::local::stream_protocol::endpoint;
using codebox::utils::LogLevel;
using codebox::utils::LogLine;

std::string ExtractMessage(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (!json.is_discarded() && json.is_object() && json.contains("message") &&
        json["message"].is_string()) {
        return json["message"].get<std::string>();
    }
    std::string trimmed = body;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }
    return trimmed.empty() ? std::string("(no message)") : trimmed;
}

ErrorKind KindForStatus(int status) {
    switch (status) {
        case 404: return ErrorKind::kNotFound;
        case 409: return ErrorKind::kConflict;
        default: return ErrorKind::kApi;
    }
}

void ThrowForStatus(int status, const std::string& body, const std::string& context) {
    if (status < 400) {
        return;
    }
    throw DockerError(KindForStatus(status), context + ": " + ExtractMessage(body), status);
}

std::string VerbName(http::verb verb) {
    const auto name = http::to_string(verb);
    return std::string(name.data(), name.size());
}

std::string GetString(const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        return source[key].get<std::string>();
    }
    return {};
}

class DockerAttachStream : public AttachStream {
public:
    DockerAttachStream()
        : socket_(ioc_) {}

    void Handshake(const std::string& socket_path,
                   const std::string& target,
                   std::chrono::milliseconds timeout) {
        http::request<http::empty_body> request{http::verb::post, target, 11};
        request.set(http::field::host, "docker");
        request.set(http::field::user_agent, "codebox");
        request.set(http::field::connection, "Upgrade");
        request.set(http::field::upgrade, "tcp");
        request.prepare_payload();

        http::response_parser<http::string_body> parser;
        beast::error_code failure;
        bool connected = false;
        bool done = false;

        socket_.async_connect(UnixEndpoint(socket_path), [&](const beast::error_code& ec) {
            if (ec) {
                failure = ec;
                done = true;
                return;
            }
            connected = true;
            http::async_write(socket_, request, [&](const beast::error_code& ec, std::size_t) {
                if (ec) {
                    failure = ec;
                    done = true;
                    return;
                }
                http::async_read_header(socket_, buffer_, parser,
                                        [&](const beast::error_code& ec, std::size_t) {
                    failure = ec;
                    done = true;
                });
            });
        });
        ioc_.run_for(timeout);

        if (!done) {
            throw DockerError(ErrorKind::kTimeout, "attach handshake timed out");
        }
        if (failure) {
            if (!connected) {
                throw DockerError(ErrorKind::kUnavailable,
                                  "cannot connect to docker daemon at " + socket_path + ": " +
                                      failure.message());
            }
            throw DockerError(ErrorKind::kApi, "attach handshake failed: " + failure.message());
        }

        const int status = static_cast<int>(parser.get().result_int());
        if (status != 101 && status != 200) {
            ioc_.restart();
            http::async_read(socket_, buffer_, parser, [](const beast::error_code&, std::size_t) {});
            ioc_.run_for(timeout);
            ThrowForStatus(status, parser.get().body(), "attach failed");
            throw DockerError(ErrorKind::kApi, "attach failed with status " + std::to_string(status),
                              status);
        }

        pending_ = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        native_ = socket_.native_handle();
    }

    int NativeHandle() const override { return native_; }

    std::string TakePending() override {
        std::string pending = std::move(pending_);
        pending_.clear();
        return pending;
    }

    std::size_t ReadSome(char* data, std::size_t size) override {
        beast::error_code ec;
        const auto read = socket_.read_some(asio::buffer(data, size), ec);
        if (ec == asio::error::eof) {
            return 0;
        }
        if (ec) {
            throw std::system_error(ec.value(), std::system_category(), "attach read");
        }
        return read;
    }

    void WriteAll(const std::string& data) override {
        beast::error_code ec;
        asio::write(socket_, asio::buffer(data), ec);
        if (ec) {
            throw std::system_error(ec.value(), std::system_category(), "attach write");
        }
    }

    void Close() override {
        if (closed_.exchange(true) || native_ < 0) {
            return;
        }
        ::shutdown(native_, SHUT_RDWR);
    }

private:
    asio::io_context ioc_;
    UnixSocket socket_;
    beast::flat_buffer buffer_;
    std::string pending_;
    int native_ = -1;
    std::atomic<bool> closed_{false};
};

}  // namespace

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNotFound: return "not_found";
        case ErrorKind::kUnavailable: return "unavailable";
        case ErrorKind::kConflict: return "conflict";
        case ErrorKind::kTimeout: return "timeout";
        case ErrorKind::kApi: return "api";
    }
    return "api";
}

DockerClient::DockerClient(std::string socket_path,
                           std::string api_version,
                           std::chrono::milliseconds request_timeout)
    : socket_path_(std::move(socket_path))
    , api_prefix_(api_version.empty() ? std::string() : "/" + api_version)
    , request_timeout_(request_timeout) {}

std::string DockerClient::Versioned(const std::string& target) const {
    return api_prefix_ + target;
}

DockerClient::HttpResult DockerClient::Request(http::verb verb,
                                               const std::string& target,
                                               const std::string& body) const {
    return Request(verb, target, body, request_timeout_);
}

DockerClient::HttpResult DockerClient::Request(http::verb verb,
                                               const std::string& target,
                                               const std::string& body,
                                               std::chrono::milliseconds timeout) const {
    asio::io_context ioc;
    UnixSocket socket(ioc);

    http::request<http::string_body> request{verb, Versioned(target), 11};
    request.set(http::field::host, "docker");
    request.set(http::field::user_agent, "codebox");
    if (!body.empty()) {
        request.set(http::field::content_type, "application/json");
        request.body() = body;
    }
    request.prepare_payload();

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    beast::error_code failure;
    bool connected = false;
    bool done = false;

    try {
        socket.async_connect(UnixEndpoint(socket_path_), [&](const beast::error_code& ec) {
            if (ec) {
                failure = ec;
                done = true;
                return;
            }
            connected = true;
            http::async_write(socket, request, [&](const beast::error_code& ec, std::size_t) {
                if (ec) {
                    failure = ec;
                    done = true;
                    return;
                }
                http::async_read(socket, buffer, response,
                                 [&](const beast::error_code& ec, std::size_t) {
                    failure = ec;
                    done = true;
                });
            });
        });
        ioc.run_for(timeout);
    } catch (const boost::system::system_error& ex) {
        throw DockerError(ErrorKind::kUnavailable,
                          "cannot connect to docker daemon at " + socket_path_ + ": " + ex.what());
    }

    if (!done) {
        throw DockerError(ErrorKind::kTimeout,
                          VerbName(verb) + " " + target + " timed out");
    }
    if (failure) {
        if (!connected) {
            throw DockerError(ErrorKind::kUnavailable,
                              "cannot connect to docker daemon at " + socket_path_ + ": " +
                                  failure.message());
        }
        throw DockerError(ErrorKind::kApi,
                          VerbName(verb) + " " + target + " failed: " +
                              failure.message());
    }

    beast::error_code ignored;
    socket.shutdown(UnixSocket::shutdown_both, ignored);
    return {static_cast<int>(response.result_int()), response.body()};
}

void DockerClient::Ping() {
    const auto result = Request(http::verb::get, "/_ping");
    ThrowForStatus(result.status, result.body, "ping failed");
}

std::string DockerClient::Create(const ContainerSpec& spec) {
    nlohmann::json body;
    body["Image"] = spec.image;
    body["Cmd"] = spec.command;
    body["WorkingDir"] = spec.working_dir;
    body["AttachStdin"] = true;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;
    body["OpenStdin"] = true;
    body["StdinOnce"] = false;
    body["Tty"] = false;
    body["Labels"] = spec.labels;

    nlohmann::json env = nlohmann::json::array();
    for (const auto& [key, value] : spec.env) {
        env.push_back(key + "=" + value);
    }
    body["Env"] = env;

    nlohmann::json host_config = nlohmann::json::object();
    if (!spec.host_path.empty()) {
        host_config["Binds"] = nlohmann::json::array({
            spec.host_path + ":" + spec.container_path + ":rw"});
    }
    if (spec.memory_bytes.has_value()) {
        host_config["Memory"] = *spec.memory_bytes;
        host_config["MemorySwap"] = *spec.memory_bytes;
    }
    if (spec.nano_cpus > 0) {
        host_config["NanoCpus"] = spec.nano_cpus;
    }
    if (spec.pids_limit > 0) {
        host_config["PidsLimit"] = spec.pids_limit;
    }
    if (spec.network_disabled) {
        host_config["NetworkMode"] = "none";
    }
    body["HostConfig"] = host_config;

    std::string target = "/containers/create";
    if (!spec.name.empty()) {
        target += "?name=" + spec.name;
    }
    const auto result = Request(http::verb::post, target, body.dump());
    if (result.status == 404) {
        throw DockerError(ErrorKind::kNotFound,
                          "Docker image '" + spec.image + "' not found: " +
                              ExtractMessage(result.body),
                          result.status);
    }
    ThrowForStatus(result.status, result.body, "create container failed");

    const auto json = nlohmann::json::parse(result.body, nullptr, false);
    const auto id = json.is_object() ? GetString(json, "Id") : std::string();
    if (id.empty()) {
        throw DockerError(ErrorKind::kApi, "create container returned no id");
    }
    if (json.contains("Warnings") && json["Warnings"].is_array()) {
        for (const auto& warning : json["Warnings"]) {
            if (warning.is_string()) {
                LogLine(LogLevel::kWarn, "docker").Field("container", codebox::utils::ShortId(id))
                    << warning.get<std::string>();
            }
        }
    }
    return id;
}

std::shared_ptr<AttachStream> DockerClient::Attach(const std::string& id) {
    auto stream = std::make_shared<DockerAttachStream>();
    stream->Handshake(socket_path_,
                      Versioned("/containers/" + id + "/attach?stdin=1&stdout=1&stderr=1&stream=1"),
                      request_timeout_);
    return stream;
}

void DockerClient::Start(const std::string& id) {
    const auto result = Request(http::verb::post, "/containers/" + id + "/start");
    // 304: already started.
    ThrowForStatus(result.status, result.body, "start container failed");
}

WaitResult DockerClient::Wait(const std::string& id, std::chrono::milliseconds timeout) {
    const auto result = Request(http::verb::post,
                                "/containers/" + id + "/wait?condition=not-running",
                                {},
                                timeout);
    ThrowForStatus(result.status, result.body, "wait container failed");

    WaitResult wait{};
    const auto json = nlohmann::json::parse(result.body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return wait;
    }
    if (json.contains("StatusCode") && json["StatusCode"].is_number_integer()) {
        wait.status_code = json["StatusCode"].get<int>();
    }
    if (json.contains("Error") && json["Error"].is_object()) {
        wait.error = GetString(json["Error"], "Message");
    }
    return wait;
}

void DockerClient::Kill(const std::string& id) {
    const auto result = Request(http::verb::post, "/containers/" + id + "/kill?signal=SIGKILL");
    ThrowForStatus(result.status, result.body, "kill container failed");
}

void DockerClient::Remove(const std::string& id, bool force) {
    const auto result = Request(http::verb::delete_,
                                "/containers/" + id + (force ? "?force=true&v=true" : "?v=true"));
    ThrowForStatus(result.status, result.body, "remove container failed");
}

ContainerState DockerClient::Inspect(const std::string& id) {
    const auto result = Request(http::verb::get, "/containers/" + id + "/json");
    ThrowForStatus(result.status, result.body, "inspect container failed");

    ContainerState state{};
    const auto json = nlohmann::json::parse(result.body, nullptr, false);
    if (json.is_discarded() || !json.contains("State") || !json["State"].is_object()) {
        throw DockerError(ErrorKind::kApi, "inspect container returned no state");
    }
    const auto& source = json["State"];
    state.status = GetString(source, "Status");
    state.error = GetString(source, "Error");
    if (source.contains("Running") && source["Running"].is_boolean()) {
        state.running = source["Running"].get<bool>();
    } else {
        state.running = state.status == "running";
    }
    if (source.contains("ExitCode") && source["ExitCode"].is_number_integer()) {
        state.exit_code = source["ExitCode"].get<int>();
    }
    if (source.contains("OOMKilled") && source["OOMKilled"].is_boolean()) {
        state.oom_killed = source["OOMKilled"].get<bool>();
    }
    return state;
}

std::vector<MountPoint> DockerClient::Mounts(const std::string& id) {
    const auto result = Request(http::verb::get, "/containers/" + id + "/json");
    ThrowForStatus(result.status, result.body, "inspect container failed");

    std::vector<MountPoint> mounts;
    const auto json = nlohmann::json::parse(result.body, nullptr, false);
    if (json.is_discarded() || !json.contains("Mounts") || !json["Mounts"].is_array()) {
        return mounts;
    }
    for (const auto& item : json["Mounts"]) {
        if (!item.is_object()) {
            continue;
        }
        MountPoint mount{};
        mount.source = GetString(item, "Source");
        mount.destination = GetString(item, "Destination");
        if (!mount.source.empty() && !mount.destination.empty()) {
            mounts.push_back(std::move(mount));
        }
    }
    return mounts;
}

}  // namespace codebox::docker
