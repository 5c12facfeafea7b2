#pragma once

#include <string>
#include <vector>

#include "sandbox/execution_result.hpp"
#include "sandbox/file_set.hpp"

namespace healbox::repair {

struct HealingAttempt {
    int index = 0;
    sandbox::FileSet files;
    sandbox::ExecutionResult result;
};

enum class HealingState {
    kRunning,
    kSucceeded,
    kExhausted
};

inline const char* ToString(HealingState state) {
    switch (state) {
        case HealingState::kRunning: return "running";
        case HealingState::kSucceeded: return "succeeded";
        case HealingState::kExhausted: return "exhausted";
    }
    return "running";
}

struct HealingSession {
    std::string entry_point;
    sandbox::FileSet current_files;
    std::vector<HealingAttempt> history;
    int max_attempts = 5;
    bool success = false;

    HealingState State() const {
        if (success) {
            return HealingState::kSucceeded;
        }
        if (static_cast<int>(history.size()) >= max_attempts) {
            return HealingState::kExhausted;
        }
        return HealingState::kRunning;
    }
};

struct HealingReport {
    sandbox::FileSet final_files;
    std::vector<HealingAttempt> history;
    bool success = false;
    std::string last_output;
    std::string last_error;
};

}  // namespace healbox::repair
