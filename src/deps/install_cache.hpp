#pragma once

#include <optional>
#include <string>

#include "sandbox/container_runtime.hpp"

namespace healbox::deps {

// Manifest hash of the last successful install, kept as a marker file inside
// one sandbox session's container. Lives and dies with that session.
class InstallCache {
public:
    InstallCache(sandbox::ContainerRuntime& runtime, std::string marker_path);

    std::optional<std::string> Lookup(const std::string& session_id);
    void Record(const std::string& session_id, const std::string& hash);

    const std::optional<std::string>& LastSeen() const { return last_seen_; }

    bool GuiPackagesAttempted() const { return gui_packages_attempted_; }
    void MarkGuiPackagesAttempted() { gui_packages_attempted_ = true; }

private:
    sandbox::ContainerRuntime& runtime_;
    std::string marker_path_;
    std::optional<std::string> last_seen_;
    bool gui_packages_attempted_ = false;
};

}  // namespace healbox::deps
