#pragma once

#include <optional>
#include <string>
#include <vector>

namespace healbox::deps {

enum class ManifestFormat {
    kNone,
    kRequirementsTxt,
    kPyprojectToml,
    kSetupPy,
    kPipfile,
    kPoetryLock,
    kInferred
};

inline const char* ToString(ManifestFormat format) {
    switch (format) {
        case ManifestFormat::kNone: return "none";
        case ManifestFormat::kRequirementsTxt: return "requirements.txt";
        case ManifestFormat::kPyprojectToml: return "pyproject.toml";
        case ManifestFormat::kSetupPy: return "setup.py";
        case ManifestFormat::kPipfile: return "Pipfile";
        case ManifestFormat::kPoetryLock: return "poetry.lock";
        case ManifestFormat::kInferred: return "inferred";
    }
    return "none";
}

struct ManifestDecision {
    ManifestFormat format = ManifestFormat::kNone;
    // Workspace-relative path the manifest lives at once synced.
    std::string path;
    std::string content;
    std::string hash;
    // Module imported to confirm a hash hit really reflects installed state.
    std::optional<std::string> sentinel_module;
    std::vector<std::string> gui_toolkits;
    // True when content was generated from import scanning and must be
    // added to the synced tree.
    bool synthesized = false;

    bool HasManifest() const { return format != ManifestFormat::kNone; }
};

}  // namespace healbox::deps
