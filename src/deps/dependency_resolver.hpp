#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "deps/dependency_inference.hpp"
#include "deps/install_cache.hpp"
#include "deps/manifest.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/execution_result.hpp"
#include "sandbox/file_set.hpp"

namespace healbox::deps {

struct ResolverOptions {
    std::chrono::seconds install_timeout{540};
    bool install_gui_packages = true;
};

class DependencyResolver {
public:
    DependencyResolver(sandbox::ContainerRuntime& runtime,
                       ResolverOptions options,
                       std::unique_ptr<DependencyInferrer> inferrer = nullptr);

    // Pure: picks the manifest by priority or synthesizes one from imports.
    ManifestDecision Resolve(const sandbox::FileSet& files) const;

    // nullopt when installation was skipped on a verified cache hit or when
    // there is nothing to install. A non-zero result means the attempt must
    // stop before execution.
    std::optional<sandbox::ExecutionResult> Install(const std::string& session_id,
                                                    const ManifestDecision& decision,
                                                    InstallCache& cache);

    std::vector<std::string> InstallCommand(const ManifestDecision& decision) const;

private:
    bool SentinelPasses(const std::string& session_id, const std::string& module);
    void InstallGuiPackages(const std::string& session_id, InstallCache& cache);

    sandbox::ContainerRuntime& runtime_;
    ResolverOptions options_;
    std::unique_ptr<DependencyInferrer> inferrer_;
};

// Manifest files recognized in the file set, highest priority first.
const std::vector<std::pair<std::string, ManifestFormat>>& ManifestPriority();

// Import name of the first requirement in a flat requirements list.
std::optional<std::string> FirstRequirementModule(const std::string& requirements);

// Import name of the first dependency a manifest declares, used as the
// sentinel for a hash hit. nullopt when the manifest declares none.
std::optional<std::string> FirstDeclaredModule(ManifestFormat format, const std::string& content);

}  // namespace healbox::deps
