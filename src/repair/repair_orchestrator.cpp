#include "repair/repair_orchestrator.hpp"

#include <iostream>
#include <utility>

#include "sandbox/errors.hpp"

namespace healbox::repair {
namespace {

// Drops updates that could not be written next to the current files.
sandbox::FileSet MergeableUpdates(const sandbox::FileSet& files, const sandbox::FileSet& updates) {
    sandbox::FileSet merged = files;
    sandbox::FileSet accepted;
    for (const auto& [path, content] : updates) {
        if (!sandbox::IsSafeRelativePath(path) || sandbox::ConflictsWithFileSet(merged, path)) {
            std::cerr << "[heal] dropping update for unusable path '" << path << "'" << std::endl;
            continue;
        }
        merged[path] = content;
        accepted[path] = content;
    }
    return accepted;
}

}  // namespace

RepairOrchestrator::RepairOrchestrator(sandbox::ExecutionSandbox& sandbox, PatchGenerator& generator)
    : sandbox_(sandbox)
    , generator_(generator) {}

HealingSession RepairOrchestrator::Begin(sandbox::FileSet files, std::string entry_point, int max_attempts) {
    if (files.count(entry_point) == 0) {
        throw sandbox::PreconditionError("entry point '" + entry_point + "' is not part of the file set");
    }
    if (max_attempts < 0) {
        throw sandbox::PreconditionError("max attempts must not be negative");
    }
    HealingSession session{};
    session.entry_point = std::move(entry_point);
    session.current_files = std::move(files);
    session.max_attempts = max_attempts;
    return session;
}

HealingReport RepairOrchestrator::Report(const HealingSession& session) {
    HealingReport report{};
    report.final_files = session.current_files;
    report.history = session.history;
    report.success = session.success;
    if (!session.history.empty()) {
        report.last_output = session.history.back().result.output;
        report.last_error = session.history.back().result.error;
    }
    return report;
}

HealingReport RepairOrchestrator::Heal(HealingSession& session) {
    if (session.current_files.count(session.entry_point) == 0) {
        throw sandbox::PreconditionError("entry point '" + session.entry_point + "' is not part of the file set");
    }

    while (session.State() == HealingState::kRunning) {
        const int index = static_cast<int>(session.history.size());
        auto result = sandbox_.Run(session.current_files, session.entry_point);
        std::cerr << "[heal] attempt " << (index + 1) << "/" << session.max_attempts
                  << " exit=" << result.exit_code
                  << (result.timed_out ? " (timeout)" : "") << std::endl;

        session.history.push_back(HealingAttempt{index, session.current_files, result});
        if (result.exit_code == 0) {
            session.success = true;
            break;
        }

        PatchRequest request{session.current_files, result.error, result.output};
        const auto patch = generator_.RequestPatch(request);
        const auto updates = MergeableUpdates(session.current_files, patch.file_updates);
        if (updates.empty()) {
            std::cerr << "[heal] no file updates returned; attempt consumed" << std::endl;
            continue;
        }
        sandbox::MergeFiles(session.current_files, updates);
    }

    std::cerr << "[heal] " << ToString(session.State()) << " after "
              << session.history.size() << " attempt(s)" << std::endl;
    return Report(session);
}

HealingReport RepairOrchestrator::Resume(HealingSession& session, int additional_attempts) {
    if (additional_attempts < 0) {
        throw sandbox::PreconditionError("additional attempts must not be negative");
    }
    if (!session.success) {
        session.max_attempts = static_cast<int>(session.history.size()) + additional_attempts;
    }
    return Heal(session);
}

}  // namespace healbox::repair
