#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "deps/dependency_resolver.hpp"
#include "deps/install_cache.hpp"
#include "sandbox/command_executor.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/file_set.hpp"
#include "sandbox/file_synchronizer.hpp"

namespace healbox::sandbox {

// Anything that can execute a file set and report the outcome.
class ExecutionSandbox {
public:
    virtual ~ExecutionSandbox() = default;
    virtual ExecutionResult Run(const FileSet& files, const std::string& entry_point) = 0;
};

// Owns one uniquely named container for its lifetime. The container is
// created lazily by the first Run and only removed by an explicit Destroy.
class SandboxSession : public ExecutionSandbox {
public:
    SandboxSession(ContainerRuntime& runtime, const config::SandboxConfig& config);

    // ensure running -> sync -> install (stops on failure) -> execute.
    // Throws PreconditionError before touching the runtime when entry_point
    // is not in files or a path is unsafe.
    ExecutionResult Run(const FileSet& files, const std::string& entry_point) override;

    void Destroy();

    const std::string& Id() const { return id_; }
    bool Started() const { return started_; }
    const std::optional<std::string>& DependencyHashSeen() const { return cache_.LastSeen(); }

    static std::string GenerateId(const std::string& prefix);

private:
    ContainerRuntime& runtime_;
    std::string id_;
    std::chrono::seconds exec_timeout_;
    FileSynchronizer sync_;
    deps::DependencyResolver resolver_;
    deps::InstallCache cache_;
    CommandExecutor executor_;
    bool started_ = false;
};

}  // namespace healbox::sandbox
