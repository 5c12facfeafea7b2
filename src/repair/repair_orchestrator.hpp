#pragma once

#include <string>

#include "repair/healing_session.hpp"
#include "repair/patch_generator.hpp"
#include "sandbox/sandbox_session.hpp"

namespace healbox::repair {

// Bounded run -> patch -> merge loop. Execution and install failures are
// recorded as data; only PreconditionError and InfrastructureError escape.
class RepairOrchestrator {
public:
    RepairOrchestrator(sandbox::ExecutionSandbox& sandbox, PatchGenerator& generator);

    // Runs until an attempt exits 0 or history reaches max_attempts.
    HealingReport Heal(HealingSession& session);

    // Grants additional attempts to an exhausted session and continues from
    // its current files and history.
    HealingReport Resume(HealingSession& session, int additional_attempts);

    static HealingSession Begin(sandbox::FileSet files, std::string entry_point, int max_attempts);
    static HealingReport Report(const HealingSession& session);

private:
    sandbox::ExecutionSandbox& sandbox_;
    PatchGenerator& generator_;
};

}  // namespace healbox::repair
