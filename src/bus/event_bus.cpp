#include "bus/event_bus.hpp"

#include "utils/logging.hpp"

namespace codebox::bus {

void EventBus::Publish(const ExecutionEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push(event);
    }
    cv_.notify_one();
}

ExecutionEvent EventBus::Consume() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty(); });
    auto event = events_.front();
    events_.pop();
    return event;
}

bool EventBus::TryConsume(ExecutionEvent& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return false;
    }
    event = events_.front();
    events_.pop();
    return true;
}

std::size_t EventBus::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void EventBus::Subscribe(const std::string& client_id, Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[client_id].push_back(std::move(callback));
}

void EventBus::Unsubscribe(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(client_id);
}

void EventBus::Dispatch() {
    running_ = true;
    while (running_) {
        ExecutionEvent event{};
        if (!TryConsume(event, std::chrono::milliseconds(1000))) {
            continue;
        }
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = subscribers_.find(event.client_id);
            if (it != subscribers_.end()) {
                callbacks = it->second;
            }
            auto all = subscribers_.find("*");
            if (all != subscribers_.end()) {
                callbacks.insert(callbacks.end(), all->second.begin(), all->second.end());
            }
        }
        for (const auto& cb : callbacks) {
            if (!cb) {
                continue;
            }
            try {
                cb(event);
            } catch (const std::exception& ex) {
                codebox::utils::LogLine(codebox::utils::LogLevel::kError, "bus")
                    .Field("job", event.job_id)
                    << "subscriber threw: " << ex.what();
            }
        }
    }
}

void EventBus::Stop() {
    running_ = false;
}

}  // namespace codebox::bus
