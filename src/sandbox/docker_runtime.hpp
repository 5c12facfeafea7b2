#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "sandbox/container_runtime.hpp"

namespace healbox::sandbox {

using CommandRunner = std::function<ExecutionResult(const std::vector<std::string>&,
                                                    std::chrono::seconds)>;

class DockerRuntime : public ContainerRuntime {
public:
    // create_timeout bounds `run`, which may have to pull the image first.
    DockerRuntime(std::string binary,
                  std::string image,
                  std::string workspace,
                  CommandRunner runner = {},
                  std::chrono::seconds create_timeout = std::chrono::seconds(540));

    void EnsureRunning(const std::string& session_id) override;
    void CopyTree(const std::string& session_id,
                  const std::filesystem::path& local_dir) override;
    ExecutionResult Exec(const std::string& session_id,
                         const std::vector<std::string>& command,
                         std::chrono::seconds timeout) override;
    void Destroy(const std::string& session_id) override;

    std::string Workspace() const override { return workspace_; }

private:
    ExecutionResult RunCli(const std::vector<std::string>& args,
                           std::chrono::seconds timeout) const;
    ExecutionResult RunLifecycle(const std::vector<std::string>& args,
                                 const std::string& verb,
                                 std::chrono::seconds timeout) const;
    bool Exists(const std::string& session_id, bool include_stopped) const;

    std::string binary_;
    std::string image_;
    std::string workspace_;
    CommandRunner runner_;
    std::chrono::seconds create_timeout_;
};

}  // namespace healbox::sandbox
