#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace healbox::sandbox {

// Relative path -> text content. Keys are unique and iterate in path order.
using FileSet = std::map<std::string, std::string>;

// Replaces only the paths named in updates; every other entry is left untouched.
void MergeFiles(FileSet& files, const FileSet& updates);

// Rejects empty, absolute and parent-escaping paths, "." segments and
// anything that names a directory rather than a file.
bool IsSafeRelativePath(const std::string& path);

// True when path would need an existing file to act as a directory, or an
// existing file lives below path.
bool ConflictsWithFileSet(const FileSet& files, const std::string& path);

std::optional<std::string> DetectEntryPoint(const FileSet& files);

FileSet LoadFileSet(const std::filesystem::path& root);
void WriteFileSet(const std::filesystem::path& root, const FileSet& files);

}  // namespace healbox::sandbox
