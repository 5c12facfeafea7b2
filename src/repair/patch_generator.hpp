#pragma once

#include <string>

#include "sandbox/file_set.hpp"

namespace healbox::repair {

struct PatchRequest {
    sandbox::FileSet files;
    std::string error_text;
    // Captured stdout of the failed attempt; test runners report there.
    std::string output_text;
};

struct PatchResponse {
    // Full replacement content per path. Empty when nothing usable came back.
    sandbox::FileSet file_updates;
};

// Proposes file replacements for a failing project.
class PatchGenerator {
public:
    virtual ~PatchGenerator() = default;
    virtual PatchResponse RequestPatch(const PatchRequest& request) = 0;
};

}  // namespace healbox::repair
