#include "sandbox/sandbox_session.hpp"

#include <atomic>
#include <iostream>
#include <random>

#include "sandbox/errors.hpp"

namespace healbox::sandbox {
namespace {

constexpr const char* kHashMarker = ".healbox_deps_hash";

std::atomic<unsigned long long> g_session_counter{0};

void CheckPreconditions(const FileSet& files, const std::string& entry_point) {
    if (entry_point.empty() || files.count(entry_point) == 0) {
        throw PreconditionError("entry point '" + entry_point + "' is not part of the file set");
    }
    for (const auto& [path, content] : files) {
        if (!IsSafeRelativePath(path)) {
            throw PreconditionError("unsafe path in file set: '" + path + "'");
        }
    }
}

}  // namespace

std::string SandboxSession::GenerateId(const std::string& prefix) {
    static const char* kChars = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id = prefix + "_";
    for (int i = 0; i < 12; ++i) {
        id.push_back(kChars[dist(gen)]);
    }
    id += "_" + std::to_string(g_session_counter.fetch_add(1));
    return id;
}

SandboxSession::SandboxSession(ContainerRuntime& runtime, const config::SandboxConfig& config)
    : runtime_(runtime)
    , id_(GenerateId(config.container_prefix))
    , exec_timeout_(config.exec_timeout_s)
    , sync_(runtime)
    , resolver_(runtime,
                deps::ResolverOptions{std::chrono::seconds(config.install_timeout_s),
                                      config.install_gui_packages})
    , cache_(runtime, runtime.Workspace() + "/" + kHashMarker)
    , executor_(runtime, std::chrono::seconds(config.server_timeout_s)) {}

ExecutionResult SandboxSession::Run(const FileSet& files, const std::string& entry_point) {
    CheckPreconditions(files, entry_point);

    // EnsureRunning can fail after the container exists; Destroy tolerates a missing one.
    started_ = true;
    runtime_.EnsureRunning(id_);

    const auto decision = resolver_.Resolve(files);
    if (decision.synthesized) {
        auto staged_files = files;
        staged_files[decision.path] = decision.content;
        const auto staged = sync_.Stage(staged_files);
        sync_.Push(id_, staged);
    } else {
        const auto staged = sync_.Stage(files);
        sync_.Push(id_, staged);
    }

    const auto install = resolver_.Install(id_, decision, cache_);
    if (install && !install->Succeeded()) {
        return *install;
    }

    return executor_.Execute(id_, files, entry_point, exec_timeout_);
}

void SandboxSession::Destroy() {
    if (!started_) {
        return;
    }
    runtime_.Destroy(id_);
    started_ = false;
}

}  // namespace healbox::sandbox
