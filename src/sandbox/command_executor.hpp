#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "sandbox/container_runtime.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/file_set.hpp"

namespace healbox::sandbox {

class CommandExecutor {
public:
    CommandExecutor(ContainerRuntime& runtime, std::chrono::seconds server_timeout);

    ExecutionResult Execute(const std::string& session_id,
                            const FileSet& files,
                            const std::string& entry_point,
                            std::chrono::seconds timeout);

    // Test runner over every test file when one is present, else the entry point.
    static std::vector<std::string> BuildCommand(const FileSet& files, const std::string& entry_point);

    static bool IsTestFile(const std::string& path);
    static bool LooksLikeServer(const FileSet& files);

    // Appends a note to stderr when it shows a missing display / Tk. The
    // original text is kept verbatim.
    static void AnnotateGuiFailure(ExecutionResult& result);

private:
    ContainerRuntime& runtime_;
    std::chrono::seconds server_timeout_;
};

}  // namespace healbox::sandbox
