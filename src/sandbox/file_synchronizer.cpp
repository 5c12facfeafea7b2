#include "sandbox/file_synchronizer.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <random>
#include <utility>
#include <unistd.h>

#include "sandbox/errors.hpp"

namespace healbox::sandbox {
namespace {

std::atomic<unsigned long long> g_stage_counter{0};

std::string RandomSuffix() {
    static const char* kChars = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string suffix;
    suffix.reserve(8);
    for (int i = 0; i < 8; ++i) {
        suffix.push_back(kChars[dist(gen)]);
    }
    return suffix;
}

std::filesystem::path CreateUniqueDirectory() {
    const auto base = std::filesystem::temp_directory_path();
    for (int attempt = 0; attempt < 16; ++attempt) {
        const auto name = "healbox_stage_" + std::to_string(::getpid()) + "_" +
            std::to_string(g_stage_counter.fetch_add(1)) + "_" + RandomSuffix();
        const auto candidate = base / name;
        std::error_code ec;
        if (std::filesystem::create_directory(candidate, ec)) {
            return candidate;
        }
        if (ec) {
            throw InfrastructureError("failed to create staging directory " + candidate.string() +
                                      ": " + ec.message());
        }
    }
    throw InfrastructureError("failed to allocate a unique staging directory");
}

}  // namespace

StagedDirectory::StagedDirectory(std::filesystem::path path)
    : path_(std::move(path)) {}

StagedDirectory::~StagedDirectory() {
    Remove();
}

StagedDirectory::StagedDirectory(StagedDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

StagedDirectory& StagedDirectory::operator=(StagedDirectory&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void StagedDirectory::Remove() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        std::cerr << "[sync] failed to remove " << path_.string() << ": " << ec.message() << std::endl;
    }
    path_.clear();
}

FileSynchronizer::FileSynchronizer(ContainerRuntime& runtime)
    : runtime_(runtime) {}

StagedDirectory FileSynchronizer::Stage(const FileSet& files) const {
    StagedDirectory staged(CreateUniqueDirectory());
    WriteFileSet(staged.Path(), files);
    return staged;
}

void FileSynchronizer::Push(const std::string& session_id, const StagedDirectory& staged) const {
    runtime_.CopyTree(session_id, staged.Path());
}

}  // namespace healbox::sandbox
