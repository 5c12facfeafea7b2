#pragma once

#include <string>
#include <utility>

namespace healbox::sandbox {

// Reserved exit code for a command killed at its deadline.
constexpr int kTimeoutExitCode = 124;

struct ExecutionResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;

    bool Succeeded() const { return exit_code == 0 && !timed_out; }
};

inline ExecutionResult TimeoutResult(std::string output = {}) {
    ExecutionResult result{};
    result.exit_code = kTimeoutExitCode;
    result.timed_out = true;
    result.output = std::move(output);
    result.error = "Execution timed out";
    return result;
}

}  // namespace healbox::sandbox
