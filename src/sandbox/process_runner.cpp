#include "sandbox/process_runner.hpp"

#include <boost/process/v1.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/errors.hpp"

namespace healbox::sandbox {
namespace bp = boost::process::v1;
namespace {

std::atomic<unsigned long long> g_capture_counter{0};

std::filesystem::path CapturePath(const std::string& stream, const std::string& stamp) {
    return std::filesystem::temp_directory_path() /
        ("healbox_" + stream + "_" + stamp + ".log");
}

std::string ReadCapture(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

ExecutionResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                   std::chrono::seconds timeout) {
    if (argv.empty()) {
        throw InfrastructureError("empty command");
    }

    const auto executable = bp::search_path(argv.front());
    if (executable.empty()) {
        throw InfrastructureError("executable not found on PATH: " + argv.front());
    }

    const auto stamp = std::to_string(::getpid()) + "_" +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
        std::to_string(g_capture_counter.fetch_add(1));
    const auto stdout_path = CapturePath("stdout", stamp);
    const auto stderr_path = CapturePath("stderr", stamp);

    ExecutionResult result{};
    const std::vector<std::string> args(argv.begin() + 1, argv.end());

    try {
        bp::child child_process(
            executable,
            bp::args(args),
            bp::std_in.close(),
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        bool finished = false;
        bool wait_failed = false;
        int status = 0;
        const pid_t pid = child_process.id();
        while (std::chrono::steady_clock::now() < deadline) {
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                finished = true;
                break;
            }
            if (waited < 0) {
                wait_failed = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (!finished && !wait_failed) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            bool reaped = false;
            const auto grace_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (std::chrono::steady_clock::now() < grace_deadline) {
                const auto waited = ::waitpid(pid, &status, WNOHANG);
                if (waited == pid || waited < 0) {
                    reaped = true;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (!reaped) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }
        child_process.detach();

        if (result.timed_out) {
            result.exit_code = kTimeoutExitCode;
        } else if (wait_failed) {
            result.exit_code = -1;
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
    } catch (const bp::process_error& ex) {
        std::error_code ec;
        std::filesystem::remove(stdout_path, ec);
        std::filesystem::remove(stderr_path, ec);
        throw InfrastructureError(std::string("failed to launch ") + argv.front() + ": " + ex.what());
    }

    result.output = ReadCapture(stdout_path);
    result.error = ReadCapture(stderr_path);
    if (result.timed_out && result.error.empty()) {
        result.error = "Execution timed out";
    }

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace healbox::sandbox
