#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "sandbox/execution_result.hpp"

namespace healbox::sandbox {

class ProcessRunner {
public:
    // Runs argv[0] (resolved on PATH) with the remaining arguments. A process
    // still alive at the deadline is terminated and reported with
    // kTimeoutExitCode. Throws InfrastructureError when the binary cannot be
    // launched.
    static ExecutionResult Run(const std::vector<std::string>& argv,
                               std::chrono::seconds timeout);
};

}  // namespace healbox::sandbox
