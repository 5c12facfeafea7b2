#pragma once

#include <exception>
#include <functional>
#include <iostream>

#include "sandbox/errors.hpp"

namespace healbox::cli {

constexpr int kExitPrecondition = 2;
constexpr int kExitInfrastructure = 3;
constexpr int kExitUnexpected = 4;

// Runs a command and maps escaping exceptions to exit codes with a log line.
inline int RunReportingErrors(const std::function<int()>& command) {
    try {
        return command();
    } catch (const sandbox::PreconditionError& e) {
        std::cerr << "[healbox] " << e.what() << std::endl;
        return kExitPrecondition;
    } catch (const sandbox::InfrastructureError& e) {
        std::cerr << "[healbox] infrastructure failure: " << e.what() << std::endl;
        return kExitInfrastructure;
    } catch (const std::exception& e) {
        std::cerr << "[healbox] unexpected failure: " << e.what() << std::endl;
        return kExitUnexpected;
    }
}

}  // namespace healbox::cli
