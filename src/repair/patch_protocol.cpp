#include "repair/patch_protocol.hpp"

#include <cstring>
#include <filesystem>
#include <sstream>

#include "utils/common.hpp"

namespace healbox::repair {

PatchParseResult ParsePatchBlocks(const std::string& response) {
    PatchParseResult result{};
    const auto open_len = std::strlen(kBlockOpen);
    const auto close_len = std::strlen(kBlockClose);
    const auto end_len = std::strlen(kBlockEnd);

    std::size_t cursor = 0;
    while (true) {
        const auto open = response.find(kBlockOpen, cursor);
        if (open == std::string::npos) {
            break;
        }
        const auto name_begin = open + open_len;
        const auto close = response.find(kBlockClose, name_begin);
        if (close == std::string::npos) {
            break;
        }
        const auto raw_name = response.substr(name_begin, close - name_begin);
        const auto body_begin = close + close_len;
        if (raw_name.find('\n') != std::string::npos ||
            body_begin >= response.size() || response[body_begin] != '\n') {
            cursor = name_begin;
            continue;
        }
        const auto end = response.find(kBlockEnd, body_begin + 1);
        if (end == std::string::npos) {
            break;
        }
        const auto path = std::filesystem::path(utils::Trim(raw_name)).lexically_normal().generic_string();
        if (sandbox::IsSafeRelativePath(path)) {
            result.updates[path] = utils::Trim(response.substr(body_begin + 1, end - body_begin - 1));
        }
        cursor = end + end_len;
    }

    result.status = result.updates.empty()
        ? PatchParseResult::Status::kEmpty
        : PatchParseResult::Status::kOk;
    return result;
}

std::string RenderFileBlocks(const sandbox::FileSet& files) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [path, content] : files) {
        if (!first) {
            oss << "\n";
        }
        first = false;
        oss << kBlockOpen << path << kBlockClose << "\n" << content << "\n" << kBlockEnd;
    }
    return oss.str();
}

std::string BuildRepairPrompt(const sandbox::FileSet& files, const std::string& error_text) {
    std::ostringstream oss;
    oss << "You are an expert developer and code reviewer. The following project files "
           "failed to install, run, or pass their tests. Here are the files and the error output.\n\n"
        << "Your task:\n"
        << "1. Analyze the error. If it is a dependency install failure, fix the dependency "
           "manifest first (ordering, versions, missing or conflicting packages).\n"
        << "2. Fix any other issue: missing imports, syntax errors, failing tests.\n"
        << "3. Keep the files consistent: if you change one file, update every related file.\n\n"
        << "Return each changed file as:\n"
        << kBlockOpen << "filename.ext" << kBlockClose << "\n"
        << "<file content>\n"
        << kBlockEnd << "\n\n"
        << "Repeat for each file that needs changes. No explanations, just the fixed files.\n\n"
        << "FILES:\n"
        << RenderFileBlocks(files) << "\n\n"
        << "ERROR:\n"
        << error_text << "\n";
    return oss.str();
}

}  // namespace healbox::repair
