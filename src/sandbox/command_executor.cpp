#include "sandbox/command_executor.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include "utils/common.hpp"

namespace healbox::sandbox {
namespace {

constexpr const char* kGuiNote =
    "\n\nNOTE: This application requires GUI support which is not available in this "
    "sandbox environment. Consider a console-based version of the program.";

const std::vector<std::string>& ServerSignatures() {
    static const std::vector<std::string> kSignatures = {
        "from flask import",
        "import flask",
        "Flask(",
        "from fastapi import",
        "FastAPI(",
        "uvicorn.run(",
        "from django",
        "serve_forever(",
        "web.run_app("
    };
    return kSignatures;
}

const std::vector<std::string>& GuiFailureSignatures() {
    static const std::vector<std::string> kSignatures = {
        "tkinter",
        "libtk",
        "no display name",
        "couldn't connect to display",
        "cannot connect to x server",
        "could not connect to display"
    };
    return kSignatures;
}

std::string InterpreterFor(const std::string& entry_point) {
    const auto extension = std::filesystem::path(entry_point).extension().string();
    if (extension == ".js") {
        return "node";
    }
    if (extension == ".sh") {
        return "sh";
    }
    return "python";
}

}  // namespace

CommandExecutor::CommandExecutor(ContainerRuntime& runtime, std::chrono::seconds server_timeout)
    : runtime_(runtime)
    , server_timeout_(server_timeout) {}

bool CommandExecutor::IsTestFile(const std::string& path) {
    const auto name = std::filesystem::path(path).filename().string();
    if (!utils::EndsWith(name, ".py")) {
        return false;
    }
    return utils::StartsWith(name, "test_") || utils::EndsWith(name, "_test.py");
}

bool CommandExecutor::LooksLikeServer(const FileSet& files) {
    for (const auto& [path, content] : files) {
        if (!utils::EndsWith(path, ".py")) {
            continue;
        }
        for (const auto& signature : ServerSignatures()) {
            if (content.find(signature) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

std::vector<std::string> CommandExecutor::BuildCommand(const FileSet& files, const std::string& entry_point) {
    std::vector<std::string> tests;
    for (const auto& [path, content] : files) {
        if (IsTestFile(path)) {
            tests.push_back(path);
        }
    }
    if (!tests.empty()) {
        std::vector<std::string> command{"python", "-m", "pytest"};
        command.insert(command.end(), tests.begin(), tests.end());
        command.push_back("--tb=short");
        return command;
    }
    return {InterpreterFor(entry_point), entry_point};
}

void CommandExecutor::AnnotateGuiFailure(ExecutionResult& result) {
    if (result.exit_code == 0) {
        return;
    }
    const auto lowered = utils::ToLower(result.error);
    const bool gui_failure = std::any_of(
        GuiFailureSignatures().begin(),
        GuiFailureSignatures().end(),
        [&lowered](const std::string& signature) { return lowered.find(signature) != std::string::npos; });
    if (gui_failure) {
        result.error += kGuiNote;
    }
}

ExecutionResult CommandExecutor::Execute(const std::string& session_id,
                                         const FileSet& files,
                                         const std::string& entry_point,
                                         std::chrono::seconds timeout) {
    auto effective_timeout = timeout;
    if (LooksLikeServer(files)) {
        effective_timeout = std::min(timeout, server_timeout_);
        std::cerr << "[exec] server framework detected; timeout clamped to "
                  << effective_timeout.count() << "s" << std::endl;
    }

    const auto command = BuildCommand(files, entry_point);
    std::cerr << "[exec] " << utils::Join(command, " ") << std::endl;
    auto result = runtime_.Exec(session_id, command, effective_timeout);
    if (result.timed_out) {
        std::cerr << "[exec] timed out after " << effective_timeout.count() << "s" << std::endl;
        return result;
    }
    AnnotateGuiFailure(result);
    std::cerr << "[exec] exit code " << result.exit_code << std::endl;
    return result;
}

}  // namespace healbox::sandbox
