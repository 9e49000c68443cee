#include "sandbox/io_bridge.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <system_error>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace {

using codebox::utils::LogLevel;
using codebox::utils::LogLine;

constexpr std::size_t kReadChunk = 4096;

int ToPollTimeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return 0;
    }
    return static_cast<int>(timeout.count());
}

}  // namespace

const char* ToString(BridgeState state) {
    switch (state) {
        case BridgeState::kAttached: return "attached";
        case BridgeState::kStreaming: return "streaming";
        case BridgeState::kWaitingForInput: return "waiting_for_input";
        case BridgeState::kDraining: return "draining";
        case BridgeState::kClosed: return "closed";
    }
    return "unknown";
}

InteractiveBridge::InteractiveBridge(docker::ContainerRuntime& runtime,
                                     std::string container_id,
                                     std::shared_ptr<docker::AttachStream> stream,
                                     std::shared_ptr<InputChannel> input,
                                     BridgeCallbacks callbacks,
                                     BridgeOptions options)
    : runtime_(runtime)
    , container_id_(std::move(container_id))
    , stream_(std::move(stream))
    , input_(std::move(input))
    , callbacks_(std::move(callbacks))
    , options_(options) {}

bool InteractiveBridge::Active() const {
    const auto state = state_.load();
    return state == BridgeState::kStreaming || state == BridgeState::kWaitingForInput;
}

void InteractiveBridge::Transition(BridgeState next) {
    const auto previous = state_.exchange(next);
    if (previous != next) {
        LogLine(LogLevel::kDebug, "bridge").Field("container", codebox::utils::ShortId(container_id_))
            << ToString(previous) << " -> " << ToString(next);
    }
}

BridgeResult InteractiveBridge::Run() {
    Transition(BridgeState::kStreaming);
    const auto pending = stream_->TakePending();
    if (!pending.empty()) {
        HandleBytes(pending);
    }

    while (Active()) {
        pollfd fds[2] = {};
        fds[0].fd = stream_->NativeHandle();
        fds[0].events = POLLIN;
        fds[1].fd = input_->WakeHandle();
        fds[1].events = POLLIN;

        const int ready = ::poll(fds, 2, ToPollTimeout(options_.idle_tick));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result_.transport_failed = true;
            LogLine(LogLevel::kWarn, "bridge").Field("container", codebox::utils::ShortId(container_id_))
                << "poll failed: " << std::strerror(errno);
            Transition(BridgeState::kDraining);
            break;
        }

        if (ready == 0) {
            if (!ContainerRunning()) {
                Transition(BridgeState::kDraining);
            } else if (!awaiting_notified_) {
                awaiting_notified_ = true;
                Transition(BridgeState::kWaitingForInput);
                if (callbacks_.on_awaiting_input) {
                    callbacks_.on_awaiting_input();
                }
            }
            continue;
        }

        if ((fds[1].revents & POLLIN) != 0 && !ForwardInput()) {
            Transition(BridgeState::kDraining);
            break;
        }
        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0 && !ReadOnce()) {
            Transition(BridgeState::kDraining);
        }
    }

    Drain();
    ResolveExitCode();
    Transition(BridgeState::kClosed);
    return result_;
}

bool InteractiveBridge::ReadOnce() {
    char buffer[kReadChunk];
    std::size_t read = 0;
    try {
        read = stream_->ReadSome(buffer, sizeof(buffer));
    } catch (const std::system_error& ex) {
        result_.transport_failed = true;
        stream_eof_ = true;
        LogLine(LogLevel::kWarn, "bridge").Field("container", codebox::utils::ShortId(container_id_))
            << "attach stream dropped: " << ex.what();
        return false;
    }
    if (read == 0) {
        stream_eof_ = true;
        return false;
    }
    HandleBytes(std::string_view(buffer, read));
    return true;
}

bool InteractiveBridge::ForwardInput() {
    for (auto& text : input_->Drain()) {
        if (text.empty() || text.back() != '\n') {
            text.push_back('\n');
        }
        try {
            stream_->WriteAll(text);
        } catch (const std::system_error& ex) {
            // The program closed stdin or already exited; the job is over.
            result_.input_failed = true;
            LogLine(LogLevel::kInfo, "bridge").Field("container", codebox::utils::ShortId(container_id_))
                << "stdin write failed, ending stream: " << ex.what();
            return false;
        }
        awaiting_notified_ = false;
        if (state_ == BridgeState::kWaitingForInput) {
            Transition(BridgeState::kStreaming);
        }
    }
    if (input_->IsClosed()) {
        result_.stopped = true;
        return false;
    }
    return true;
}

void InteractiveBridge::HandleBytes(std::string_view bytes) {
    awaiting_notified_ = false;
    if (state_ == BridgeState::kWaitingForInput) {
        Transition(BridgeState::kStreaming);
    }
    for (const auto& frame : decoder_.Feed(bytes)) {
        ++result_.frames;
        auto& text_decoder = frame.stream == docker::StreamType::kStderr ? stderr_text_ : stdout_text_;
        Emit(frame.stream, text_decoder.Decode(frame.payload));
    }
}

void InteractiveBridge::Emit(docker::StreamType stream, const std::string& text) {
    if (text.empty() || !callbacks_.on_output) {
        return;
    }
    callbacks_.on_output(stream, text);
}

bool InteractiveBridge::ContainerRunning() {
    try {
        return runtime_.Inspect(container_id_).running;
    } catch (const docker::DockerError& ex) {
        if (ex.Kind() != docker::ErrorKind::kNotFound) {
            result_.transport_failed = true;
            LogLine(LogLevel::kWarn, "bridge").Field("container", codebox::utils::ShortId(container_id_))
                << "inspect failed: " << ex.what();
        }
        return false;
    }
}

void InteractiveBridge::Drain() {
    if (input_->IsClosed()) {
        result_.stopped = true;
    }
    // A stopped job's output is discarded along with its container.
    if (!stream_eof_ && !result_.stopped) {
        const auto deadline = std::chrono::steady_clock::now() + options_.drain_timeout;
        while (true) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }
            pollfd fd{};
            fd.fd = stream_->NativeHandle();
            fd.events = POLLIN;
            const int ready = ::poll(&fd, 1, ToPollTimeout(remaining));
            if (ready < 0 && errno == EINTR) {
                continue;
            }
            if (ready <= 0 || !ReadOnce()) {
                break;
            }
        }
    }

    Emit(docker::StreamType::kStdout, stdout_text_.Flush());
    Emit(docker::StreamType::kStderr, stderr_text_.Flush());
    if (decoder_.Buffered() > 0) {
        LogLine(LogLevel::kWarn, "bridge").Field("container", codebox::utils::ShortId(container_id_))
            .Field("bytes", static_cast<long long>(decoder_.Buffered()))
            << "stream ended inside a frame, discarding partial frame";
    }
}

void InteractiveBridge::ResolveExitCode() {
    try {
        const auto state = runtime_.Inspect(container_id_);
        if (!state.running) {
            result_.exit_code = state.exit_code;
            result_.exit_code_known = true;
            if (state.oom_killed) {
                result_.error = "Container ran out of memory and was killed.";
            } else if (!state.error.empty()) {
                result_.error = state.error;
            }
            return;
        }
        if (result_.stopped) {
            return;
        }
        const auto wait = runtime_.Wait(container_id_, options_.drain_timeout);
        result_.exit_code = wait.status_code;
        result_.exit_code_known = true;
        if (!wait.error.empty()) {
            result_.error = wait.error;
        }
    } catch (const docker::DockerError& ex) {
        LogLine(LogLevel::kDebug, "bridge").Field("container", codebox::utils::ShortId(container_id_))
            .Field("kind", docker::ToString(ex.Kind()))
            << "exit code unavailable: " << ex.what();
    }
}

}  // namespace codebox::sandbox
