#pragma once

#include <string>

#include "sandbox/file_set.hpp"

namespace healbox::repair {

// Wire format shared by repair prompts and patch responses:
//
//   <<FILENAME:path/to/file.py>>
//   ...file content...
//   <<END>>
inline constexpr const char* kBlockOpen = "<<FILENAME:";
inline constexpr const char* kBlockClose = ">>";
inline constexpr const char* kBlockEnd = "<<END>>";

struct PatchParseResult {
    enum class Status { kOk, kEmpty };

    Status status = Status::kEmpty;
    sandbox::FileSet updates;

    bool Empty() const { return status == Status::kEmpty; }
};

// Never throws. Text outside blocks, unterminated blocks, and blocks naming
// unsafe paths are ignored; a later block for the same path wins.
PatchParseResult ParsePatchBlocks(const std::string& response);

std::string RenderFileBlocks(const sandbox::FileSet& files);

std::string BuildRepairPrompt(const sandbox::FileSet& files, const std::string& error_text);

}  // namespace healbox::repair
