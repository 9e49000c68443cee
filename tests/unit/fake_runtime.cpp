#include "fake_runtime.hpp"

#include <cerrno>
#include <poll.h>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace codebox::testing {
namespace {

using docker::DockerError;
using docker::ErrorKind;

constexpr auto kSlice = std::chrono::milliseconds(10);

bool SendAll(int fd, const std::string& bytes) {
    std::size_t sent = 0;
    while (sent < bytes.size()) {
        const auto written = ::send(fd, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<std::size_t>(written);
    }
    return true;
}

class FakeStream : public docker::AttachStream {
public:
    explicit FakeStream(int fd)
        : fd_(fd) {}

    ~FakeStream() override {
        ::close(fd_);
    }

    int NativeHandle() const override { return fd_; }

    std::size_t ReadSome(char* data, std::size_t size) override {
        while (true) {
            const auto read = ::read(fd_, data, size);
            if (read >= 0) {
                return static_cast<std::size_t>(read);
            }
            if (errno != EINTR) {
                throw std::system_error(errno, std::generic_category(), "fake attach read");
            }
        }
    }

    void WriteAll(const std::string& data) override {
        if (!SendAll(fd_, data)) {
            throw std::system_error(errno, std::generic_category(), "fake attach write");
        }
    }

    void Close() override {
        if (!closed_.exchange(true)) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

private:
    int fd_;
    std::atomic<bool> closed_{false};
};

}  // namespace

ProgramIo::ProgramIo(int fd, const std::atomic<bool>& killed, std::string workspace)
    : fd_(fd)
    , killed_(killed)
    , workspace_(std::move(workspace)) {}

bool ProgramIo::Out(const std::string& text) {
    return Raw(docker::EncodeFrame(docker::StreamType::kStdout, text));
}

bool ProgramIo::Err(const std::string& text) {
    return Raw(docker::EncodeFrame(docker::StreamType::kStderr, text));
}

bool ProgramIo::Raw(const std::string& bytes) {
    return SendAll(fd_, bytes);
}

std::optional<std::string> ProgramIo::ReadLine(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!killed_) {
        const auto newline = stdin_buffer_.find('\n');
        if (newline != std::string::npos) {
            auto line = stdin_buffer_.substr(0, newline);
            stdin_buffer_.erase(0, newline + 1);
            return line;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        pollfd fd{};
        fd.fd = fd_;
        fd.events = POLLIN;
        if (::poll(&fd, 1, static_cast<int>(kSlice.count())) <= 0) {
            continue;
        }
        char buffer[256];
        const auto read = ::read(fd_, buffer, sizeof(buffer));
        if (read <= 0) {
            return std::nullopt;
        }
        stdin_buffer_.append(buffer, static_cast<std::size_t>(read));
    }
    return std::nullopt;
}

void ProgramIo::SleepFor(std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!killed_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kSlice);
    }
}

FakeRuntime::FakeRuntime()
    : program_([](ProgramIo&) { return 0; }) {}

FakeRuntime::~FakeRuntime() {
    std::map<std::string, std::shared_ptr<Container>> containers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        containers.swap(containers_);
    }
    for (auto& entry : containers) {
        std::lock_guard<std::mutex> lock(entry.second->lifecycle);
        entry.second->killed = true;
        Reap(*entry.second);
    }
}

void FakeRuntime::SetProgram(Program program) {
    std::lock_guard<std::mutex> lock(mutex_);
    program_ = std::move(program);
}

void FakeRuntime::SetMissingImage(const std::string& image) {
    std::lock_guard<std::mutex> lock(mutex_);
    missing_images_.insert(image);
}

void FakeRuntime::SetMounts(const std::string& self_id, std::vector<docker::MountPoint> mounts) {
    std::lock_guard<std::mutex> lock(mutex_);
    self_id_ = self_id;
    mounts_ = std::move(mounts);
}

std::vector<docker::ContainerSpec> FakeRuntime::CreatedSpecs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return specs_;
}

std::size_t FakeRuntime::CreatedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return specs_.size();
}

std::size_t FakeRuntime::LiveContainers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t live = 0;
    for (const auto& entry : containers_) {
        if (!entry.second->removed) {
            ++live;
        }
    }
    return live;
}

bool FakeRuntime::Removed(const std::string& id) const {
    const auto container = Lookup(id);
    return container && container->removed;
}

std::shared_ptr<FakeRuntime::Container> FakeRuntime::Lookup(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = containers_.find(id);
    return it == containers_.end() ? nullptr : it->second;
}

void FakeRuntime::Reap(Container& container) {
    if (container.thread.joinable()) {
        container.thread.join();
    }
    if (container.daemon_fd >= 0) {
        ::close(container.daemon_fd);
        container.daemon_fd = -1;
    }
}

void FakeRuntime::Ping() {
    if (ping_fails_) {
        throw DockerError(ErrorKind::kUnavailable, "cannot connect to docker daemon at /fake.sock");
    }
}

std::string FakeRuntime::Create(const docker::ContainerSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (missing_images_.count(spec.image) > 0) {
        throw DockerError(ErrorKind::kNotFound, "Docker image '" + spec.image + "' not found", 404);
    }
    const auto id = "fake" + std::to_string(++next_id_) + "0123456789abcdef";
    auto container = std::make_shared<Container>();
    container->spec = spec;
    containers_[id] = container;
    specs_.push_back(spec);
    return id;
}

std::shared_ptr<docker::AttachStream> FakeRuntime::Attach(const std::string& id) {
    auto container = Lookup(id);
    if (!container || container->removed) {
        throw DockerError(ErrorKind::kNotFound, "No such container: " + id, 404);
    }
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        throw std::system_error(errno, std::generic_category(), "socketpair");
    }
    container->daemon_fd = fds[1];
    return std::make_shared<FakeStream>(fds[0]);
}

void FakeRuntime::Start(const std::string& id) {
    auto container = Lookup(id);
    if (!container) {
        throw DockerError(ErrorKind::kNotFound, "No such container: " + id, 404);
    }
    std::lock_guard<std::mutex> lifecycle(container->lifecycle);
    if (container->removed) {
        throw DockerError(ErrorKind::kNotFound, "No such container: " + id, 404);
    }
    if (container->started.exchange(true)) {
        return;
    }
    Program program;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        program = program_;
    }
    container->running = true;
    Container* raw = container.get();
    container->thread = std::thread([raw, program]() {
        ProgramIo io(raw->daemon_fd, raw->killed, raw->spec.host_path);
        int code = program(io);
        if (raw->killed) {
            code = 137;
        }
        raw->exit_code = code;
        raw->running = false;
        // The daemon closes the attach stream once the process is gone.
        ::shutdown(raw->daemon_fd, SHUT_RDWR);
    });
}

docker::WaitResult FakeRuntime::Wait(const std::string& id, std::chrono::milliseconds timeout) {
    auto container = Lookup(id);
    if (!container || container->removed) {
        throw DockerError(ErrorKind::kNotFound, "No such container: " + id, 404);
    }
    if (!WaitUntil([&]() { return !container->running.load(); }, timeout)) {
        throw DockerError(ErrorKind::kTimeout, "wait timed out");
    }
    docker::WaitResult result{};
    result.status_code = container->exit_code;
    return result;
}

void FakeRuntime::Kill(const std::string& id) {
    auto container = Lookup(id);
    if (!container || container->removed) {
        throw DockerError(ErrorKind::kNotFound, "No such container: " + id, 404);
    }
    if (!container->running) {
        throw DockerError(ErrorKind::kConflict, "Container " + id + " is not running", 409);
    }
    container->killed = true;
    WaitUntil([&]() { return !container->running.load(); }, std::chrono::seconds(2));
}

void FakeRuntime::Remove(const std::string& id, bool force) {
    auto container = Lookup(id);
    if (!container) {
        throw DockerError(ErrorKind::kNotFound, "No such container: " + id, 404);
    }
    std::lock_guard<std::mutex> lifecycle(container->lifecycle);
    if (container->removed) {
        throw DockerError(ErrorKind::kNotFound, "No such container: " + id, 404);
    }
    if (container->running) {
        if (!force) {
            throw DockerError(ErrorKind::kConflict, "You cannot remove a running container", 409);
        }
        container->killed = true;
    }
    if (container->removed.exchange(true)) {
        throw DockerError(ErrorKind::kNotFound, "No such container: " + id, 404);
    }
    Reap(*container);
}

docker::ContainerState FakeRuntime::Inspect(const std::string& id) {
    auto container = Lookup(id);
    if (!container || container->removed) {
        throw DockerError(ErrorKind::kNotFound, "No such container: " + id, 404);
    }
    docker::ContainerState state{};
    state.running = container->running;
    state.status = state.running ? "running" : (container->started ? "exited" : "created");
    state.exit_code = state.running ? 0 : container->exit_code.load();
    return state;
}

std::vector<docker::MountPoint> FakeRuntime::Mounts(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (id != self_id_) {
        throw DockerError(ErrorKind::kNotFound, "No such container: " + id, 404);
    }
    return mounts_;
}

bool WaitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

std::vector<bus::ExecutionEvent> CollectUntilFinished(bus::EventBus& bus,
                                                      const std::string& job_id,
                                                      std::chrono::milliseconds timeout) {
    std::vector<bus::ExecutionEvent> events;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        bus::ExecutionEvent event;
        if (!bus.TryConsume(event, std::chrono::milliseconds(50))) {
            continue;
        }
        if (event.job_id != job_id) {
            continue;
        }
        events.push_back(event);
        if (event.IsTerminal()) {
            break;
        }
    }
    return events;
}

std::string JoinedOutput(const std::vector<bus::ExecutionEvent>& events, const std::string& stream) {
    std::string joined;
    for (const auto& event : events) {
        if (event.kind == bus::EventKind::kOutput && event.stream == stream) {
            joined += event.text;
        }
    }
    return joined;
}

}  // namespace codebox::testing
