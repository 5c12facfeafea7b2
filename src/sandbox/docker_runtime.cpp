#include "sandbox/docker_runtime.hpp"

#include <iostream>
#include <utility>

#include "sandbox/errors.hpp"
#include "sandbox/process_runner.hpp"
#include "utils/common.hpp"

namespace healbox::sandbox {
namespace {

constexpr std::chrono::seconds kLifecycleTimeout{120};
// Extra time the local client gets so the in-container timeout fires first.
constexpr std::chrono::seconds kExecGrace{10};
// Seconds between SIGTERM and SIGKILL inside the container.
constexpr const char* kKillAfter = "2";

bool IsDaemonUnreachable(const ExecutionResult& result) {
    const auto text = utils::ToLower(result.error + "\n" + result.output);
    return text.find("cannot connect to the docker daemon") != std::string::npos ||
        text.find("is the docker daemon running") != std::string::npos ||
        text.find("error during connect") != std::string::npos;
}

bool IsMissingContainer(const ExecutionResult& result) {
    const auto text = utils::ToLower(result.error);
    return text.find("no such container") != std::string::npos ||
        (text.find("container") != std::string::npos && text.find("is not running") != std::string::npos);
}

std::string FirstLine(const std::string& text) {
    const auto trimmed = utils::Trim(text);
    const auto newline = trimmed.find('\n');
    return newline == std::string::npos ? trimmed : trimmed.substr(0, newline);
}

}  // namespace

DockerRuntime::DockerRuntime(std::string binary,
                             std::string image,
                             std::string workspace,
                             CommandRunner runner,
                             std::chrono::seconds create_timeout)
    : binary_(std::move(binary))
    , image_(std::move(image))
    , workspace_(std::move(workspace))
    , runner_(std::move(runner))
    , create_timeout_(create_timeout) {
    if (!runner_) {
        runner_ = &ProcessRunner::Run;
    }
}

ExecutionResult DockerRuntime::RunCli(const std::vector<std::string>& args,
                                      std::chrono::seconds timeout) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary_);
    argv.insert(argv.end(), args.begin(), args.end());
    auto result = runner_(argv, timeout);
    if (!result.timed_out && result.exit_code != 0 && IsDaemonUnreachable(result)) {
        throw InfrastructureError(binary_ + " daemon unreachable: " + FirstLine(result.error));
    }
    return result;
}

ExecutionResult DockerRuntime::RunLifecycle(const std::vector<std::string>& args,
                                            const std::string& verb,
                                            std::chrono::seconds timeout) const {
    auto result = RunCli(args, timeout);
    if (result.exit_code != 0) {
        throw InfrastructureError(binary_ + " " + verb + " failed (exit " +
                                  std::to_string(result.exit_code) + "): " + FirstLine(result.error));
    }
    return result;
}

bool DockerRuntime::Exists(const std::string& session_id, bool include_stopped) const {
    std::vector<std::string> args{"ps", "-q", "-f", "name=^" + session_id + "$"};
    if (include_stopped) {
        args.insert(args.begin() + 1, "-a");
    }
    const auto result = RunLifecycle(args, "ps", kLifecycleTimeout);
    return !utils::Trim(result.output).empty();
}

void DockerRuntime::EnsureRunning(const std::string& session_id) {
    if (Exists(session_id, false)) {
        return;
    }
    if (Exists(session_id, true)) {
        std::cerr << "[sandbox] restarting stopped container " << session_id << std::endl;
        RunLifecycle({"start", session_id}, "start", kLifecycleTimeout);
    } else {
        std::cerr << "[sandbox] creating container " << session_id
                  << " image=" << image_ << std::endl;
        RunLifecycle({"run", "-dit", "--name", session_id, "-w", workspace_, image_, "sleep", "infinity"},
                     "run", create_timeout_);
    }
    RunLifecycle({"exec", session_id, "mkdir", "-p", workspace_}, "exec mkdir", kLifecycleTimeout);
}

void DockerRuntime::CopyTree(const std::string& session_id,
                             const std::filesystem::path& local_dir) {
    RunLifecycle({"cp", local_dir.string() + "/.", session_id + ":" + workspace_}, "cp", kLifecycleTimeout);
}

ExecutionResult DockerRuntime::Exec(const std::string& session_id,
                                    const std::vector<std::string>& command,
                                    std::chrono::seconds timeout) {
    // coreutils timeout ends the command inside the container too; killing the
    // local client alone leaves it running.
    std::vector<std::string> args{"exec", "-w", workspace_, session_id,
                                  "timeout", "-k", kKillAfter, std::to_string(timeout.count())};
    args.insert(args.end(), command.begin(), command.end());
    auto result = RunCli(args, timeout + kExecGrace);
    if (!result.timed_out && result.exit_code == kTimeoutExitCode) {
        result.timed_out = true;
        if (result.error.empty()) {
            result.error = "Execution timed out";
        }
    }
    if (result.timed_out) {
        result.exit_code = kTimeoutExitCode;
        return result;
    }
    if (result.exit_code != 0 && IsMissingContainer(result)) {
        throw InfrastructureError("container " + session_id + " unavailable: " + FirstLine(result.error));
    }
    return result;
}

void DockerRuntime::Destroy(const std::string& session_id) {
    try {
        const auto result = RunCli({"rm", "-f", session_id}, kLifecycleTimeout);
        if (result.exit_code == 0) {
            std::cerr << "[sandbox] removed container " << session_id << std::endl;
        }
    } catch (const InfrastructureError& ex) {
        std::cerr << "[sandbox] remove " << session_id << " ignored: " << ex.what() << std::endl;
    }
}

}  // namespace healbox::sandbox
