#include <doctest/doctest.h>

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "cli/exit_status.hpp"
#include "sandbox/errors.hpp"

using namespace healbox;

TEST_CASE("command results pass through unchanged") {
    CHECK(cli::RunReportingErrors([] { return 0; }) == 0);
    CHECK(cli::RunReportingErrors([] { return 1; }) == 1);
}

TEST_CASE("the two fatal error kinds map to their exit codes") {
    CHECK(cli::RunReportingErrors([]() -> int {
        throw sandbox::PreconditionError("entry point 'main.py' is not part of the file set");
    }) == cli::kExitPrecondition);
    CHECK(cli::RunReportingErrors([]() -> int {
        throw sandbox::InfrastructureError("docker daemon unreachable");
    }) == cli::kExitInfrastructure);
}

TEST_CASE("any other exception is reported instead of terminating") {
    CHECK(cli::RunReportingErrors([]() -> int {
        throw std::filesystem::filesystem_error(
            "recursive_directory_iterator", "/project/private",
            std::make_error_code(std::errc::permission_denied));
    }) == cli::kExitUnexpected);
    CHECK(cli::RunReportingErrors([]() -> int {
        throw std::runtime_error("write failed");
    }) == cli::kExitUnexpected);
}
