#pragma once

#include <string>
#include <vector>

#include "sandbox/file_set.hpp"

namespace healbox::deps {

struct InferredDependencies {
    // Distribution names, sorted and unique.
    std::vector<std::string> packages;
    // GUI toolkit imports seen anywhere in the scan.
    std::vector<std::string> gui_toolkits;

    bool Empty() const { return packages.empty(); }
};

// Strategy used only when the file set carries no manifest.
class DependencyInferrer {
public:
    virtual ~DependencyInferrer() = default;
    virtual InferredDependencies Infer(const sandbox::FileSet& files) const = 0;
};

// Scans .py files for top-level import/from statements, dropping the standard
// library and modules that live in the project itself.
class PythonImportInferrer : public DependencyInferrer {
public:
    InferredDependencies Infer(const sandbox::FileSet& files) const override;
};

// GUI toolkit modules imported by any .py file, sorted.
std::vector<std::string> DetectGuiToolkits(const sandbox::FileSet& files);

// requirements.txt text for the inferred packages, with system-package
// guidance appended when a GUI toolkit was seen.
std::string RenderRequirements(const InferredDependencies& inferred);

// "beautifulsoup4" -> "bs4", "Flask-Cors" -> "flask_cors".
std::string ModuleForDistribution(const std::string& distribution);

// "cv2" -> "opencv-python"; unknown modules map to themselves.
std::string DistributionForModule(const std::string& module);

}  // namespace healbox::deps
