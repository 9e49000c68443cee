#include "sandbox/input_channel.hpp"

#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace codebox::sandbox {

InputChannel::InputChannel() {
    if (::pipe2(pipe_, O_NONBLOCK | O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "input channel pipe");
    }
}

InputChannel::~InputChannel() {
    for (int fd : pipe_) {
        if (fd >= 0) {
            ::close(fd);
        }
    }
}

bool InputChannel::Push(std::string text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        pending_.push_back(std::move(text));
    }
    Wake();
    return true;
}

std::vector<std::string> InputChannel::Drain() {
    char scratch[64];
    while (::read(pipe_[0], scratch, sizeof(scratch)) > 0) {
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> items(pending_.begin(), pending_.end());
    pending_.clear();
    return items;
}

void InputChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.exchange(true)) {
            return;
        }
    }
    Wake();
}

void InputChannel::Wake() {
    const char byte = 1;
    // A full pipe already guarantees a pending wakeup.
    while (::write(pipe_[1], &byte, 1) < 0 && errno == EINTR) {
    }
}

}  // namespace codebox::sandbox
