#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "sandbox/execution_result.hpp"

namespace healbox::sandbox {

// Lifecycle and exec verbs against a container runtime. The session id doubles
// as the container name.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Idempotent: no-op when the named container is already running.
    virtual void EnsureRunning(const std::string& session_id) = 0;

    // Copies the contents of local_dir into the workspace, overwriting files
    // with the same path and leaving every other workspace file in place.
    virtual void CopyTree(const std::string& session_id,
                          const std::filesystem::path& local_dir) = 0;

    // Non-zero exits and timeouts come back as data; only an unreachable
    // runtime throws.
    virtual ExecutionResult Exec(const std::string& session_id,
                                 const std::vector<std::string>& command,
                                 std::chrono::seconds timeout) = 0;

    // Force-removes the container. Safe on an already removed container.
    virtual void Destroy(const std::string& session_id) = 0;

    virtual std::string Workspace() const = 0;
};

}  // namespace healbox::sandbox
