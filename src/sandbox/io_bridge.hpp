#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "docker/container_runtime.hpp"
#include "docker/frame_codec.hpp"
#include "sandbox/input_channel.hpp"

namespace codebox::sandbox {

enum class BridgeState {
    kAttached,
    kStreaming,
    kWaitingForInput,
    kDraining,
    kClosed
};

const char* ToString(BridgeState state);

struct BridgeOptions {
    // No data for one tick while the container runs means it waits for input.
    std::chrono::milliseconds idle_tick{1000};
    std::chrono::milliseconds drain_timeout{2000};
};

struct BridgeCallbacks {
    std::function<void(docker::StreamType, const std::string&)> on_output;
    std::function<void()> on_awaiting_input;
};

struct BridgeResult {
    int exit_code = -1;
    bool exit_code_known = false;
    bool stopped = false;
    bool input_failed = false;
    bool transport_failed = false;
    std::string error;
    std::size_t frames = 0;
};

// Duplex loop between one container's attach stream and its consumer:
// decoded output goes to the callbacks, queued input goes to stdin.
class InteractiveBridge {
public:
    InteractiveBridge(docker::ContainerRuntime& runtime,
                      std::string container_id,
                      std::shared_ptr<docker::AttachStream> stream,
                      std::shared_ptr<InputChannel> input,
                      BridgeCallbacks callbacks,
                      BridgeOptions options = {});

    BridgeResult Run();
    BridgeState State() const { return state_; }

private:
    bool ReadOnce();
    bool ForwardInput();
    void HandleBytes(std::string_view bytes);
    void Emit(docker::StreamType stream, const std::string& text);
    bool ContainerRunning();
    void Drain();
    void ResolveExitCode();
    void Transition(BridgeState next);
    bool Active() const;

    docker::ContainerRuntime& runtime_;
    std::string container_id_;
    std::shared_ptr<docker::AttachStream> stream_;
    std::shared_ptr<InputChannel> input_;
    BridgeCallbacks callbacks_;
    BridgeOptions options_;

    std::atomic<BridgeState> state_{BridgeState::kAttached};
    docker::FrameDecoder decoder_;
    docker::Utf8StreamDecoder stdout_text_;
    docker::Utf8StreamDecoder stderr_text_;
    bool awaiting_notified_ = false;
    bool stream_eof_ = false;
    BridgeResult result_;
};

}  // namespace codebox::sandbox
