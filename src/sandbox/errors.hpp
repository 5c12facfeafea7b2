#pragma once

#include <stdexcept>
#include <string>

namespace healbox::sandbox {

// Caller supplied an unusable request (e.g. entry point missing from the file set).
// Raised before any container is touched and never retried.
class PreconditionError : public std::runtime_error {
public:
    explicit PreconditionError(const std::string& message)
        : std::runtime_error(message) {}
};

// The container runtime is unreachable or a lifecycle verb failed.
class InfrastructureError : public std::runtime_error {
public:
    explicit InfrastructureError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace healbox::sandbox
