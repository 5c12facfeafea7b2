#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cli/exit_status.hpp"
#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "providers/llm_provider.hpp"
#include "repair/healing_json.hpp"
#include "repair/llm_patch_generator.hpp"
#include "repair/repair_orchestrator.hpp"
#include "sandbox/docker_runtime.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/file_set.hpp"
#include "sandbox/sandbox_session.hpp"
#include "store/run_store.hpp"

namespace {

constexpr const char* kUsage =
    "Usage:\n"
    "  healbox run <project_dir> [--entry FILE] [--attempts N] [--timeout S]\n"
    "                            [--image IMAGE] [--out DIR] [--json]\n"
    "  healbox exec <project_dir> [--entry FILE] [--timeout S] [--image IMAGE]\n"
    "  healbox resume <run_id> [--attempts N] [--out DIR] [--json]\n"
    "  healbox runs\n";

struct CliOptions {
    std::string target;
    std::string entry;
    std::optional<int> attempts;
    std::optional<int> timeout;
    std::string image;
    std::string out;
    bool json = false;
};

bool ParseCount(const std::string& text, int& value) {
    try {
        std::size_t used = 0;
        value = std::stoi(text, &used);
        return used == text.size() && value >= 0;
    } catch (const std::exception&) {
        return false;
    }
}

std::optional<CliOptions> ParseOptions(int argc, char** argv) {
    if (argc < 3) {
        return std::nullopt;
    }
    CliOptions options{};
    options.target = argv[2];
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--json") {
            options.json = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "missing value for " << arg << std::endl;
            return std::nullopt;
        }
        const std::string value = argv[++i];
        int number = 0;
        if (arg == "--entry") {
            options.entry = value;
        } else if (arg == "--image") {
            options.image = value;
        } else if (arg == "--out") {
            options.out = value;
        } else if (arg == "--attempts" && ParseCount(value, number)) {
            options.attempts = number;
        } else if (arg == "--timeout" && ParseCount(value, number) && number > 0) {
            options.timeout = number;
        } else {
            std::cerr << "invalid option: " << arg << " " << value << std::endl;
            return std::nullopt;
        }
    }
    return options;
}

void ApplyOverrides(const CliOptions& options, healbox::config::Config& config) {
    if (!options.image.empty()) {
        config.sandbox.image = options.image;
    }
    if (options.timeout) {
        config.sandbox.exec_timeout_s = *options.timeout;
    }
    if (options.attempts) {
        config.healing.max_attempts = *options.attempts;
    }
}

// Removes the container on every exit path, exceptions included.
class SandboxGuard {
public:
    explicit SandboxGuard(healbox::sandbox::SandboxSession& session)
        : session_(session) {}
    ~SandboxGuard() {
        session_.Destroy();
    }

    SandboxGuard(const SandboxGuard&) = delete;
    SandboxGuard& operator=(const SandboxGuard&) = delete;

private:
    healbox::sandbox::SandboxSession& session_;
};

std::string ResolveEntryPoint(const CliOptions& options, const healbox::sandbox::FileSet& files) {
    if (!options.entry.empty()) {
        return options.entry;
    }
    auto detected = healbox::sandbox::DetectEntryPoint(files);
    if (!detected) {
        throw healbox::sandbox::PreconditionError(
            "no entry point found in " + options.target + "; pass --entry");
    }
    std::cerr << "[healbox] detected entry point " << *detected << std::endl;
    return *detected;
}

void PrintReport(const std::string& run_id, const healbox::repair::HealingReport& report, bool json) {
    if (json) {
        auto payload = healbox::repair::ToJson(report);
        payload["run_id"] = run_id;
        std::cout << healbox::repair::DumpText(payload, 2) << std::endl;
        return;
    }
    for (const auto& attempt : report.history) {
        std::cout << "attempt " << (attempt.index + 1) << ": exit " << attempt.result.exit_code
                  << (attempt.result.timed_out ? " (timed out)" : "") << std::endl;
    }
    if (report.success) {
        std::cout << "healed after " << report.history.size() << " attempt(s)" << std::endl;
        if (!report.last_output.empty()) {
            std::cout << "\n" << report.last_output << std::endl;
        }
    } else {
        std::cout << "gave up after " << report.history.size() << " attempt(s)" << std::endl;
        if (!report.last_error.empty()) {
            std::cout << "\nlast error:\n" << report.last_error << std::endl;
        }
    }
    std::cout << "run id: " << run_id << std::endl;
}

void SaveRun(healbox::store::RunStore& store,
             const std::string& run_id,
             const healbox::repair::HealingSession& healing) {
    if (!store.Save(run_id, healing)) {
        std::cerr << "[healbox] run " << run_id << " was not persisted" << std::endl;
    }
}

int Heal(healbox::store::RunStore& store,
         const std::string& run_id,
         healbox::repair::HealingSession& healing,
         std::optional<int> additional,
         const CliOptions& options,
         const healbox::config::Config& config) {
    healbox::sandbox::DockerRuntime runtime(
        config.sandbox.runtime, config.sandbox.image, config.sandbox.workspace, {},
        std::chrono::seconds(config.sandbox.install_timeout_s));
    healbox::sandbox::SandboxSession sandbox(runtime, config.sandbox);
    SandboxGuard guard(sandbox);

    auto provider = healbox::providers::CreateProvider(config);
    healbox::repair::LlmPatchGenerator generator(*provider, config.agent);
    healbox::repair::RepairOrchestrator orchestrator(sandbox, generator);

    healbox::repair::HealingReport report{};
    try {
        report = additional ? orchestrator.Resume(healing, *additional) : orchestrator.Heal(healing);
    } catch (const healbox::sandbox::InfrastructureError&) {
        SaveRun(store, run_id, healing);
        throw;
    }
    SaveRun(store, run_id, healing);

    if (!options.out.empty()) {
        healbox::sandbox::WriteFileSet(options.out, report.final_files);
        std::cerr << "[healbox] wrote " << report.final_files.size() << " file(s) to "
                  << options.out << std::endl;
    }
    PrintReport(run_id, report, options.json);
    return report.success ? 0 : 1;
}

int RunCommand(const CliOptions& options, healbox::config::Config config) {
    ApplyOverrides(options, config);
    auto files = healbox::sandbox::LoadFileSet(options.target);
    auto entry = ResolveEntryPoint(options, files);
    auto healing = healbox::repair::RepairOrchestrator::Begin(
        std::move(files), std::move(entry), config.healing.max_attempts);
    healbox::store::RunStore store(healbox::config::ExpandHome(config.healing.store_path));
    return Heal(store, healbox::store::RunStore::GenerateRunId(), healing, std::nullopt, options, config);
}

int ResumeCommand(const CliOptions& options, healbox::config::Config config) {
    ApplyOverrides(options, config);
    healbox::store::RunStore store(healbox::config::ExpandHome(config.healing.store_path));
    auto healing = store.Load(options.target);
    if (!healing) {
        throw healbox::sandbox::PreconditionError("unknown run id: " + options.target);
    }
    if (healing->success) {
        std::cout << "run " << options.target << " already succeeded" << std::endl;
        return 0;
    }
    const int additional = options.attempts.value_or(config.healing.max_attempts);
    return Heal(store, options.target, *healing, additional, options, config);
}

int ExecCommand(const CliOptions& options, healbox::config::Config config) {
    ApplyOverrides(options, config);
    const auto files = healbox::sandbox::LoadFileSet(options.target);
    const auto entry = ResolveEntryPoint(options, files);

    healbox::sandbox::DockerRuntime runtime(
        config.sandbox.runtime, config.sandbox.image, config.sandbox.workspace, {},
        std::chrono::seconds(config.sandbox.install_timeout_s));
    healbox::sandbox::SandboxSession sandbox(runtime, config.sandbox);
    SandboxGuard guard(sandbox);

    const auto result = sandbox.Run(files, entry);
    if (!result.output.empty()) {
        std::cout << result.output;
    }
    if (!result.error.empty()) {
        std::cerr << result.error;
    }
    std::cerr << "[healbox] exit " << result.exit_code
              << (result.timed_out ? " (timed out)" : "") << std::endl;
    return result.Succeeded() ? 0 : 1;
}

int RunsCommand(const healbox::config::Config& config) {
    healbox::store::RunStore store(healbox::config::ExpandHome(config.healing.store_path));
    if (!store.IsOpen()) {
        return 1;
    }
    const auto runs = store.List();
    if (runs.empty()) {
        std::cout << "no stored runs" << std::endl;
        return 0;
    }
    for (const auto& run : runs) {
        std::cout << run.id << "  " << run.updated_at << "  " << run.entry_point << "  "
                  << run.attempts << "/" << run.max_attempts << "  "
                  << (run.success ? "succeeded" : "failed") << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cout << kUsage;
        return 1;
    }
    const std::string command = argv[1];

    return healbox::cli::RunReportingErrors([&]() {
        auto config = healbox::config::LoadConfig();
        if (command == "runs") {
            return RunsCommand(config);
        }
        if (command != "run" && command != "exec" && command != "resume") {
            std::cout << kUsage;
            return 1;
        }
        const auto options = ParseOptions(argc, argv);
        if (!options) {
            std::cout << kUsage;
            return 1;
        }
        if (command == "run") {
            return RunCommand(*options, config);
        }
        if (command == "exec") {
            return ExecCommand(*options, config);
        }
        return ResumeCommand(*options, config);
    });
}
