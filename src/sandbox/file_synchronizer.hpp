#pragma once

#include <filesystem>
#include <string>

#include "sandbox/container_runtime.hpp"
#include "sandbox/file_set.hpp"

namespace healbox::sandbox {

// Scratch directory removed when the owner goes out of scope.
class StagedDirectory {
public:
    explicit StagedDirectory(std::filesystem::path path);
    ~StagedDirectory();

    StagedDirectory(StagedDirectory&& other) noexcept;
    StagedDirectory& operator=(StagedDirectory&& other) noexcept;
    StagedDirectory(const StagedDirectory&) = delete;
    StagedDirectory& operator=(const StagedDirectory&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    void Remove();

    std::filesystem::path path_;
};

class FileSynchronizer {
public:
    explicit FileSynchronizer(ContainerRuntime& runtime);

    // Writes every entry into a fresh directory no other stage call shares.
    StagedDirectory Stage(const FileSet& files) const;

    // Overlays the staged tree onto the container workspace.
    void Push(const std::string& session_id, const StagedDirectory& staged) const;

private:
    ContainerRuntime& runtime_;
};

}  // namespace healbox::sandbox
