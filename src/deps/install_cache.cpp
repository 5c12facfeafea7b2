#include "deps/install_cache.hpp"

#include <chrono>
#include <iostream>
#include <utility>

#include "utils/common.hpp"

namespace healbox::deps {
namespace {

constexpr std::chrono::seconds kMarkerTimeout{30};

}  // namespace

InstallCache::InstallCache(sandbox::ContainerRuntime& runtime, std::string marker_path)
    : runtime_(runtime)
    , marker_path_(std::move(marker_path)) {}

std::optional<std::string> InstallCache::Lookup(const std::string& session_id) {
    const auto result = runtime_.Exec(session_id, {"cat", marker_path_}, kMarkerTimeout);
    if (!result.Succeeded()) {
        last_seen_.reset();
        return std::nullopt;
    }
    const auto hash = utils::Trim(result.output);
    if (hash.empty()) {
        last_seen_.reset();
        return std::nullopt;
    }
    last_seen_ = hash;
    return hash;
}

void InstallCache::Record(const std::string& session_id, const std::string& hash) {
    const auto result = runtime_.Exec(
        session_id,
        {"sh", "-c", "printf '%s\\n' \"$1\" > \"$2\"", "sh", hash, marker_path_},
        kMarkerTimeout);
    if (!result.Succeeded()) {
        std::cerr << "[deps] failed to write hash marker " << marker_path_
                  << " exit=" << result.exit_code << std::endl;
        return;
    }
    last_seen_ = hash;
}

}  // namespace healbox::deps
