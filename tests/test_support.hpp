#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include "sandbox/container_runtime.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/file_set.hpp"
#include "utils/common.hpp"

namespace healbox::testing {

inline sandbox::ExecutionResult Result(int exit_code, std::string output = {}, std::string error = {}) {
    sandbox::ExecutionResult result{};
    result.exit_code = exit_code;
    result.output = std::move(output);
    result.error = std::move(error);
    return result;
}

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
            ("healbox_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

// In-memory container runtime. Copies land in `workspace`, the hash marker is
// simulated, and every other exec is answered by `on_exec` (exit 0 by default).
class FakeRuntime : public sandbox::ContainerRuntime {
public:
    struct ExecCall {
        std::string session_id;
        std::vector<std::string> command;
        std::chrono::seconds timeout{0};
    };

    void EnsureRunning(const std::string& session_id) override {
        if (unreachable) {
            throw sandbox::InfrastructureError("Cannot connect to the Docker daemon");
        }
        ensured.push_back(session_id);
    }

    void CopyTree(const std::string& session_id, const std::filesystem::path& local_dir) override {
        copied_to.push_back(session_id);
        sandbox::MergeFiles(workspace, sandbox::LoadFileSet(local_dir));
    }

    sandbox::ExecutionResult Exec(const std::string& session_id,
                                  const std::vector<std::string>& command,
                                  std::chrono::seconds timeout) override {
        execs.push_back({session_id, command, timeout});
        if (command.size() == 2 && command[0] == "cat" && utils::EndsWith(command[1], ".healbox_deps_hash")) {
            if (!marker) {
                return Result(1, "", "cat: " + command[1] + ": No such file or directory");
            }
            return Result(0, *marker + "\n");
        }
        if (command.size() == 6 && command[0] == "sh" && utils::EndsWith(command[5], ".healbox_deps_hash")) {
            marker = command[4];
            return Result(0);
        }
        if (on_exec) {
            return on_exec(command);
        }
        return Result(0);
    }

    void Destroy(const std::string& session_id) override {
        destroyed.push_back(session_id);
    }

    std::string Workspace() const override { return "/sandbox"; }

    std::size_t CountExecs(const std::string& program, const std::string& first_arg = {}) const {
        std::size_t count = 0;
        for (const auto& call : execs) {
            if (call.command.empty() || call.command[0] != program) {
                continue;
            }
            if (!first_arg.empty() && (call.command.size() < 2 || call.command[1] != first_arg)) {
                continue;
            }
            ++count;
        }
        return count;
    }

    bool TouchedAnything() const {
        return !ensured.empty() || !copied_to.empty() || !execs.empty() || !destroyed.empty();
    }

    bool unreachable = false;
    std::function<sandbox::ExecutionResult(const std::vector<std::string>&)> on_exec;
    std::optional<std::string> marker;
    sandbox::FileSet workspace;
    std::vector<std::string> ensured;
    std::vector<std::string> copied_to;
    std::vector<ExecCall> execs;
    std::vector<std::string> destroyed;
};

}  // namespace healbox::testing
