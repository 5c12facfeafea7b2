#include "deps/dependency_resolver.hpp"

#include <cctype>
#include <iostream>
#include <sstream>
#include <utility>

#include "deps/manifest_hash.hpp"
#include "utils/common.hpp"

namespace healbox::deps {
namespace {

constexpr std::chrono::seconds kSentinelTimeout{60};
constexpr const char* kInferredManifestPath = "requirements.txt";

// First quoted string inside the list assigned to key, as in
// `dependencies = ["x"]` or `install_requires=['x']`.
std::optional<std::string> FirstQuotedInList(const std::string& content, const std::string& key) {
    for (auto pos = content.find(key); pos != std::string::npos; pos = content.find(key, pos + 1)) {
        if (pos > 0) {
            const auto before = static_cast<unsigned char>(content[pos - 1]);
            if (std::isalnum(before) || before == '_' || before == '-' || before == '.') {
                continue;
            }
        }
        auto cursor = content.find_first_not_of(" \t", pos + key.size());
        if (cursor == std::string::npos || content[cursor] != '=') {
            continue;
        }
        cursor = content.find_first_not_of(" \t", cursor + 1);
        if (cursor == std::string::npos || content[cursor] != '[') {
            continue;
        }
        const auto close = content.find(']', cursor);
        const auto quote = content.find_first_of("\"'", cursor);
        if (quote == std::string::npos || (close != std::string::npos && close < quote)) {
            continue;
        }
        const auto end = content.find(content[quote], quote + 1);
        if (end == std::string::npos) {
            return std::nullopt;
        }
        return content.substr(quote + 1, end - quote - 1);
    }
    return std::nullopt;
}

// First key of a TOML table, skipping `skip`.
std::optional<std::string> FirstKeyInSection(const std::string& content,
                                             const std::string& section,
                                             const std::string& skip) {
    std::istringstream stream(content);
    std::string line;
    bool inside = false;
    while (std::getline(stream, line)) {
        line = utils::Trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.front() == '[') {
            inside = line == section;
            continue;
        }
        const auto equals = line.find('=');
        if (!inside || equals == std::string::npos) {
            continue;
        }
        auto key = utils::Trim(line.substr(0, equals));
        if (key.size() >= 2 && (key.front() == '"' || key.front() == '\'')) {
            key = key.substr(1, key.size() - 2);
        }
        if (!key.empty() && key != skip) {
            return key;
        }
    }
    return std::nullopt;
}

// First `name = "..."` under a [[package]] entry of a poetry lock file.
std::optional<std::string> FirstLockedPackage(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    bool inside = false;
    while (std::getline(stream, line)) {
        line = utils::Trim(line);
        if (!line.empty() && line.front() == '[') {
            inside = line == "[[package]]";
            continue;
        }
        const auto open = line.find('"');
        const auto close = line.rfind('"');
        if (inside && utils::StartsWith(line, "name") && open != std::string::npos && close > open + 1) {
            return line.substr(open + 1, close - open - 1);
        }
    }
    return std::nullopt;
}

std::string ShortHash(const std::string& hash) {
    return hash.size() > 12 ? hash.substr(0, 12) : hash;
}

}  // namespace

const std::vector<std::pair<std::string, ManifestFormat>>& ManifestPriority() {
    static const std::vector<std::pair<std::string, ManifestFormat>> kPriority = {
        {"requirements.txt", ManifestFormat::kRequirementsTxt},
        {"pyproject.toml", ManifestFormat::kPyprojectToml},
        {"setup.py", ManifestFormat::kSetupPy},
        {"Pipfile", ManifestFormat::kPipfile},
        {"poetry.lock", ManifestFormat::kPoetryLock}
    };
    return kPriority;
}

std::optional<std::string> FirstRequirementModule(const std::string& requirements) {
    std::istringstream stream(requirements);
    std::string line;
    while (std::getline(stream, line)) {
        const auto comment = line.find('#');
        if (comment != std::string::npos) {
            line = line.substr(0, comment);
        }
        line = utils::Trim(line);
        if (line.empty() || line.front() == '-') {
            continue;
        }
        const auto end = line.find_first_of("<>=!~;[ @\t");
        const auto name = utils::Trim(line.substr(0, end));
        if (name.empty() || name.find('/') != std::string::npos || name.find(':') != std::string::npos) {
            continue;
        }
        return ModuleForDistribution(name);
    }
    return std::nullopt;
}

std::optional<std::string> FirstDeclaredModule(ManifestFormat format, const std::string& content) {
    std::optional<std::string> requirement;
    switch (format) {
        case ManifestFormat::kRequirementsTxt:
        case ManifestFormat::kInferred:
            return FirstRequirementModule(content);
        case ManifestFormat::kPyprojectToml:
            requirement = FirstQuotedInList(content, "dependencies");
            if (!requirement) {
                const auto poetry = FirstKeyInSection(content, "[tool.poetry.dependencies]", "python");
                return poetry ? std::optional<std::string>(ModuleForDistribution(*poetry)) : std::nullopt;
            }
            break;
        case ManifestFormat::kSetupPy:
            requirement = FirstQuotedInList(content, "install_requires");
            break;
        case ManifestFormat::kPipfile: {
            const auto package = FirstKeyInSection(content, "[packages]", "");
            return package ? std::optional<std::string>(ModuleForDistribution(*package)) : std::nullopt;
        }
        case ManifestFormat::kPoetryLock: {
            const auto package = FirstLockedPackage(content);
            return package ? std::optional<std::string>(ModuleForDistribution(*package)) : std::nullopt;
        }
        case ManifestFormat::kNone:
            break;
    }
    return requirement ? FirstRequirementModule(*requirement) : std::nullopt;
}

DependencyResolver::DependencyResolver(sandbox::ContainerRuntime& runtime,
                                       ResolverOptions options,
                                       std::unique_ptr<DependencyInferrer> inferrer)
    : runtime_(runtime)
    , options_(options)
    , inferrer_(std::move(inferrer)) {
    if (!inferrer_) {
        inferrer_ = std::make_unique<PythonImportInferrer>();
    }
}

ManifestDecision DependencyResolver::Resolve(const sandbox::FileSet& files) const {
    ManifestDecision decision{};
    decision.gui_toolkits = DetectGuiToolkits(files);

    for (const auto& [name, format] : ManifestPriority()) {
        const auto it = files.find(name);
        if (it == files.end()) {
            continue;
        }
        decision.format = format;
        decision.path = name;
        decision.content = it->second;
        decision.hash = Sha256Hex(decision.content);
        decision.sentinel_module = FirstDeclaredModule(format, decision.content);
        return decision;
    }

    const auto inferred = inferrer_->Infer(files);
    if (inferred.Empty()) {
        return decision;
    }

    decision.format = ManifestFormat::kInferred;
    decision.path = kInferredManifestPath;
    decision.content = RenderRequirements(inferred);
    decision.hash = Sha256Hex(decision.content);
    decision.sentinel_module = ModuleForDistribution(inferred.packages.front());
    decision.synthesized = true;
    std::cerr << "[deps] no manifest found; inferred " << utils::Join(inferred.packages, ", ") << std::endl;
    return decision;
}

std::vector<std::string> DependencyResolver::InstallCommand(const ManifestDecision& decision) const {
    switch (decision.format) {
        case ManifestFormat::kPyprojectToml:
        case ManifestFormat::kSetupPy:
            return {"pip", "install", "-e", "."};
        case ManifestFormat::kPipfile:
            return {"pipenv", "install"};
        case ManifestFormat::kPoetryLock:
            return {"poetry", "install", "--no-root"};
        case ManifestFormat::kRequirementsTxt:
        case ManifestFormat::kInferred:
        case ManifestFormat::kNone:
            break;
    }
    return {"pip", "install", "-r", runtime_.Workspace() + "/" + decision.path};
}

bool DependencyResolver::SentinelPasses(const std::string& session_id, const std::string& module) {
    const auto check = runtime_.Exec(session_id, {"python", "-c", "import " + module}, kSentinelTimeout);
    return check.Succeeded();
}

void DependencyResolver::InstallGuiPackages(const std::string& session_id, InstallCache& cache) {
    cache.MarkGuiPackagesAttempted();
    std::cerr << "[deps] GUI toolkit detected; installing system packages" << std::endl;
    const auto result = runtime_.Exec(
        session_id,
        {"sh", "-c", "apt-get update && apt-get install -y python3-tk python3-dev"},
        options_.install_timeout);
    if (!result.Succeeded()) {
        std::cerr << "[deps] GUI system packages unavailable (exit " << result.exit_code
                  << "); continuing headless" << std::endl;
    }
}

std::optional<sandbox::ExecutionResult> DependencyResolver::Install(const std::string& session_id,
                                                                    const ManifestDecision& decision,
                                                                    InstallCache& cache) {
    if (!decision.gui_toolkits.empty() && options_.install_gui_packages && !cache.GuiPackagesAttempted()) {
        InstallGuiPackages(session_id, cache);
    }

    if (!decision.HasManifest()) {
        return std::nullopt;
    }

    bool need_install = true;
    const auto previous = cache.Lookup(session_id);
    if (previous && *previous == decision.hash) {
        need_install = false;
        if (decision.sentinel_module && !SentinelPasses(session_id, *decision.sentinel_module)) {
            std::cerr << "[deps] hash unchanged but `import " << *decision.sentinel_module
                      << "` failed; forcing reinstall" << std::endl;
            need_install = true;
        }
    }

    if (!need_install) {
        std::cerr << "[deps] " << ToString(decision.format) << " unchanged ("
                  << ShortHash(decision.hash) << "); skipping install" << std::endl;
        return std::nullopt;
    }

    const auto command = InstallCommand(decision);
    std::cerr << "[deps] installing: " << utils::Join(command, " ") << std::endl;
    auto result = runtime_.Exec(session_id, command, options_.install_timeout);
    if (!result.Succeeded()) {
        std::cerr << "[deps] install failed exit=" << result.exit_code << std::endl;
        return result;
    }
    cache.Record(session_id, decision.hash);
    return result;
}

}  // namespace healbox::deps
