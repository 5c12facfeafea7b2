#include <doctest/doctest.h>

#include <deque>

#include "sandbox/docker_runtime.hpp"
#include "sandbox/errors.hpp"
#include "test_support.hpp"

using namespace healbox;

namespace {

using Argv = std::vector<std::string>;

// Records every CLI invocation and answers from a queue, exit 0 when empty.
struct RecordingRunner {
    std::vector<Argv> calls;
    std::vector<std::chrono::seconds> timeouts;
    std::deque<sandbox::ExecutionResult> replies;

    sandbox::CommandRunner Bind() {
        return [this](const Argv& argv, std::chrono::seconds timeout) {
            calls.push_back(argv);
            timeouts.push_back(timeout);
            if (replies.empty()) {
                return testing::Result(0);
            }
            auto reply = replies.front();
            replies.pop_front();
            return reply;
        };
    }
};

constexpr const char* kDaemonDown =
    "Cannot connect to the Docker daemon at unix:///var/run/docker.sock. Is the docker daemon running?";

}  // namespace

TEST_CASE("EnsureRunning creates a missing container and its workspace") {
    RecordingRunner runner;
    runner.replies = {testing::Result(0, ""), testing::Result(0, "")};
    sandbox::DockerRuntime runtime("docker", "python:3.11-slim", "/sandbox", runner.Bind());

    runtime.EnsureRunning("healbox_abc");

    REQUIRE(runner.calls.size() == 4);
    CHECK(runner.calls[0] == Argv{"docker", "ps", "-q", "-f", "name=^healbox_abc$"});
    CHECK(runner.calls[1] == Argv{"docker", "ps", "-a", "-q", "-f", "name=^healbox_abc$"});
    CHECK(runner.calls[2] == Argv{"docker", "run", "-dit", "--name", "healbox_abc", "-w", "/sandbox",
                                  "python:3.11-slim", "sleep", "infinity"});
    CHECK(runner.calls[3] == Argv{"docker", "exec", "healbox_abc", "mkdir", "-p", "/sandbox"});
}

TEST_CASE("EnsureRunning is a no-op for a running container") {
    RecordingRunner runner;
    runner.replies = {testing::Result(0, "3f2a1b\n")};
    sandbox::DockerRuntime runtime("docker", "python:3.11-slim", "/sandbox", runner.Bind());

    runtime.EnsureRunning("healbox_abc");
    CHECK(runner.calls.size() == 1);
}

TEST_CASE("EnsureRunning restarts a stopped container") {
    RecordingRunner runner;
    runner.replies = {testing::Result(0, ""), testing::Result(0, "3f2a1b\n")};
    sandbox::DockerRuntime runtime("podman", "python:3.11-slim", "/sandbox", runner.Bind());

    runtime.EnsureRunning("healbox_abc");
    REQUIRE(runner.calls.size() == 4);
    CHECK(runner.calls[2] == Argv{"podman", "start", "healbox_abc"});
}

TEST_CASE("an unreachable daemon is an infrastructure error") {
    RecordingRunner runner;
    runner.replies = {testing::Result(1, "", kDaemonDown)};
    sandbox::DockerRuntime runtime("docker", "python:3.11-slim", "/sandbox", runner.Bind());

    CHECK_THROWS_AS(runtime.EnsureRunning("healbox_abc"), sandbox::InfrastructureError);
}

TEST_CASE("a failing lifecycle verb is an infrastructure error") {
    RecordingRunner runner;
    runner.replies = {testing::Result(0, ""), testing::Result(0, ""),
                      testing::Result(125, "", "Unable to find image 'nope:latest' locally")};
    sandbox::DockerRuntime runtime("docker", "nope", "/sandbox", runner.Bind());

    CHECK_THROWS_AS(runtime.EnsureRunning("healbox_abc"), sandbox::InfrastructureError);
}

TEST_CASE("CopyTree overlays the directory contents onto the workspace") {
    RecordingRunner runner;
    sandbox::DockerRuntime runtime("docker", "python:3.11-slim", "/sandbox", runner.Bind());

    runtime.CopyTree("healbox_abc", "/tmp/stage");
    REQUIRE(runner.calls.size() == 1);
    CHECK(runner.calls[0] == Argv{"docker", "cp", "/tmp/stage/.", "healbox_abc:/sandbox"});
}

TEST_CASE("Exec runs in the workspace and returns failures as data") {
    RecordingRunner runner;
    runner.replies = {testing::Result(1, "", "Traceback ...\nZeroDivisionError: division by zero")};
    sandbox::DockerRuntime runtime("docker", "python:3.11-slim", "/sandbox", runner.Bind());

    const auto result = runtime.Exec("healbox_abc", {"python", "main.py"}, std::chrono::seconds(5));
    REQUIRE(runner.calls.size() == 1);
    CHECK(runner.calls[0] == Argv{"docker", "exec", "-w", "/sandbox", "healbox_abc",
                                  "timeout", "-k", "2", "5", "python", "main.py"});
    CHECK(result.exit_code == 1);
    CHECK(result.error.find("ZeroDivisionError") != std::string::npos);
}

TEST_CASE("Exec against a vanished container is an infrastructure error") {
    RecordingRunner runner;
    runner.replies = {testing::Result(1, "", "Error response from daemon: No such container: healbox_abc")};
    sandbox::DockerRuntime runtime("docker", "python:3.11-slim", "/sandbox", runner.Bind());

    CHECK_THROWS_AS(runtime.Exec("healbox_abc", {"python", "main.py"}, std::chrono::seconds(5)),
                    sandbox::InfrastructureError);
}

TEST_CASE("Exec passes timeouts through unchanged") {
    RecordingRunner runner;
    runner.replies = {sandbox::TimeoutResult()};
    sandbox::DockerRuntime runtime("docker", "python:3.11-slim", "/sandbox", runner.Bind());

    const auto result = runtime.Exec("healbox_abc", {"python", "main.py"}, std::chrono::seconds(1));
    CHECK(result.timed_out);
    CHECK(result.exit_code == sandbox::kTimeoutExitCode);
}

TEST_CASE("Exec bounds the command inside the container before the client gives up") {
    RecordingRunner runner;
    runner.replies = {testing::Result(sandbox::kTimeoutExitCode, " * Running on http://127.0.0.1:5000", "")};
    sandbox::DockerRuntime runtime("docker", "python:3.11-slim", "/sandbox", runner.Bind());

    const auto result = runtime.Exec("healbox_abc", {"python", "app.py"}, std::chrono::seconds(15));
    REQUIRE(runner.calls.size() == 1);
    CHECK(runner.calls[0] == Argv{"docker", "exec", "-w", "/sandbox", "healbox_abc",
                                  "timeout", "-k", "2", "15", "python", "app.py"});
    CHECK(runner.timeouts[0] > std::chrono::seconds(15));
    CHECK(result.timed_out);
    CHECK(result.exit_code == sandbox::kTimeoutExitCode);
    CHECK(result.error == "Execution timed out");
}

TEST_CASE("image creation gets its own timeout") {
    RecordingRunner runner;
    runner.replies = {testing::Result(0, ""), testing::Result(0, "")};
    sandbox::DockerRuntime runtime("docker", "python:3.11-slim", "/sandbox", runner.Bind(),
                                   std::chrono::seconds(600));

    runtime.EnsureRunning("healbox_abc");
    REQUIRE(runner.timeouts.size() == 4);
    CHECK(runner.timeouts[2] == std::chrono::seconds(600));
}

TEST_CASE("Destroy force-removes and never throws") {
    RecordingRunner runner;
    runner.replies = {testing::Result(1, "", kDaemonDown)};
    sandbox::DockerRuntime runtime("docker", "python:3.11-slim", "/sandbox", runner.Bind());

    CHECK_NOTHROW(runtime.Destroy("healbox_abc"));
    REQUIRE(runner.calls.size() == 1);
    CHECK(runner.calls[0] == Argv{"docker", "rm", "-f", "healbox_abc"});
}
