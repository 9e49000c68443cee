#pragma once

#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace codebox::sandbox {

// Queue of stdin lines for one job. A self-pipe makes it pollable next to
// the attach socket, so the bridge waits on both with one poll().
class InputChannel {
public:
    InputChannel();
    ~InputChannel();

    InputChannel(const InputChannel&) = delete;
    InputChannel& operator=(const InputChannel&) = delete;

    bool Push(std::string text);
    std::vector<std::string> Drain();
    void Close();
    bool IsClosed() const { return closed_; }
    int WakeHandle() const { return pipe_[0]; }

private:
    void Wake();

    int pipe_[2] = {-1, -1};
    std::mutex mutex_;
    std::deque<std::string> pending_;
    std::atomic<bool> closed_{false};
};

}  // namespace codebox::sandbox
