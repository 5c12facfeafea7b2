#include "sandbox/file_set.hpp"

#include <fstream>
#include <sstream>
#include <vector>

#include "sandbox/errors.hpp"
#include "utils/common.hpp"

namespace healbox::sandbox {
namespace {

bool IsSkippedEntry(const std::filesystem::path& relative) {
    for (const auto& part : relative) {
        const auto name = part.string();
        if (name.empty()) {
            continue;
        }
        if (name.front() == '.' || name == "__pycache__" || name == "node_modules") {
            return true;
        }
    }
    return false;
}

}  // namespace

void MergeFiles(FileSet& files, const FileSet& updates) {
    for (const auto& [path, content] : updates) {
        files[path] = content;
    }
}

bool IsSafeRelativePath(const std::string& path) {
    if (path.empty() || path.back() == '/' || path.back() == '\\') {
        return false;
    }
    const std::filesystem::path parsed(path);
    if (parsed.is_absolute() || parsed.has_root_name() || parsed.has_root_directory()) {
        return false;
    }
    for (const auto& part : parsed) {
        if (part.empty() || part == "." || part == "..") {
            return false;
        }
    }
    return parsed.has_filename();
}

bool ConflictsWithFileSet(const FileSet& files, const std::string& path) {
    const auto as_dir = path + "/";
    const auto below = files.lower_bound(as_dir);
    if (below != files.end() && utils::StartsWith(below->first, as_dir)) {
        return true;
    }
    for (auto slash = path.find('/'); slash != std::string::npos; slash = path.find('/', slash + 1)) {
        if (files.count(path.substr(0, slash)) > 0) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> DetectEntryPoint(const FileSet& files) {
    if (files.count("main.py") > 0) {
        return std::string("main.py");
    }
    if (files.count("app.py") > 0) {
        return std::string("app.py");
    }
    std::vector<std::string> python_files;
    for (const auto& [path, content] : files) {
        if (!utils::EndsWith(path, ".py")) {
            continue;
        }
        python_files.push_back(path);
        if (content.find("__name__ == \"__main__\"") != std::string::npos ||
            content.find("__name__ == '__main__'") != std::string::npos) {
            return path;
        }
    }
    if (python_files.size() == 1) {
        return python_files.front();
    }
    return std::nullopt;
}

FileSet LoadFileSet(const std::filesystem::path& root) {
    if (!std::filesystem::is_directory(root)) {
        throw PreconditionError("project directory not found: " + root.string());
    }
    FileSet files;
    for (auto it = std::filesystem::recursive_directory_iterator(root);
         it != std::filesystem::recursive_directory_iterator();
         ++it) {
        const auto relative = std::filesystem::relative(it->path(), root);
        if (IsSkippedEntry(relative)) {
            if (it->is_directory()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file()) {
            continue;
        }
        std::ifstream input(it->path(), std::ios::in | std::ios::binary);
        if (!input.is_open()) {
            continue;
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();
        auto content = buffer.str();
        if (content.find('\0') != std::string::npos) {
            continue;
        }
        files.emplace(relative.generic_string(), std::move(content));
    }
    return files;
}

void WriteFileSet(const std::filesystem::path& root, const FileSet& files) {
    for (const auto& [path, content] : files) {
        if (!IsSafeRelativePath(path)) {
            throw PreconditionError("refusing to write unsafe path: " + path);
        }
        const auto target = root / std::filesystem::path(path);
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw InfrastructureError("failed to create " + target.parent_path().string() + ": " + ec.message());
        }
        std::ofstream output(target, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!output.is_open()) {
            throw InfrastructureError("failed to open " + target.string() + " for writing");
        }
        output << content;
    }
}

}  // namespace healbox::sandbox
