#pragma once

#include <stdexcept>
#include <string>

namespace codebox::sandbox {

enum class JobErrorKind {
    kConfiguration,
    kProvisioning,
    // Stopped before the program started.
    kCancelled
};

class JobError : public std::runtime_error {
public:
    JobError(JobErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    JobErrorKind Kind() const { return kind_; }

private:
    JobErrorKind kind_;
};

}  // namespace codebox::sandbox
