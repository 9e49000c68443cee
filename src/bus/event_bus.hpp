#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

#include "bus/events.hpp"

namespace codebox::bus {

// FIFO channel carrying execution events from the worker pool to the
// application. Events of one job keep their publish order.
class EventBus {
public:
    using Callback = std::function<void(const ExecutionEvent&)>;

    void Publish(const ExecutionEvent& event);
    ExecutionEvent Consume();
    bool TryConsume(ExecutionEvent& event, std::chrono::milliseconds timeout);
    std::size_t Size() const;

    // Callbacks keyed by client id; "*" receives every event.
    void Subscribe(const std::string& client_id, Callback callback);
    void Unsubscribe(const std::string& client_id);
    void Dispatch();
    void Stop();

private:
    std::queue<ExecutionEvent> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, std::vector<Callback>> subscribers_;
    std::atomic<bool> running_{false};
};

}  // namespace codebox::bus
