#include <doctest/doctest.h>

#include "sandbox/command_executor.hpp"
#include "test_support.hpp"

using namespace healbox;

TEST_CASE("BuildCommand picks the interpreter from the entry point") {
    CHECK(sandbox::CommandExecutor::BuildCommand({{"main.py", ""}}, "main.py") ==
          std::vector<std::string>{"python", "main.py"});
    CHECK(sandbox::CommandExecutor::BuildCommand({{"index.js", ""}}, "index.js") ==
          std::vector<std::string>{"node", "index.js"});
    CHECK(sandbox::CommandExecutor::BuildCommand({{"run.sh", ""}}, "run.sh") ==
          std::vector<std::string>{"sh", "run.sh"});
    CHECK(sandbox::CommandExecutor::BuildCommand({{"tool.rb", ""}}, "tool.rb") ==
          std::vector<std::string>{"python", "tool.rb"});
}

TEST_CASE("BuildCommand runs every test file through pytest") {
    const sandbox::FileSet files{
        {"main.py", ""},
        {"tests/test_math.py", ""},
        {"util_test.py", ""},
        {"testing.py", ""}};
    CHECK(sandbox::CommandExecutor::BuildCommand(files, "main.py") ==
          std::vector<std::string>{"python", "-m", "pytest", "tests/test_math.py", "util_test.py", "--tb=short"});
}

TEST_CASE("IsTestFile and LooksLikeServer classify files") {
    CHECK(sandbox::CommandExecutor::IsTestFile("test_x.py"));
    CHECK(sandbox::CommandExecutor::IsTestFile("pkg/x_test.py"));
    CHECK_FALSE(sandbox::CommandExecutor::IsTestFile("test_x.txt"));
    CHECK_FALSE(sandbox::CommandExecutor::IsTestFile("contest.py"));

    CHECK(sandbox::CommandExecutor::LooksLikeServer({{"app.py", "from flask import Flask\napp = Flask(__name__)"}}));
    CHECK(sandbox::CommandExecutor::LooksLikeServer({{"api.py", "uvicorn.run(app)"}}));
    CHECK_FALSE(sandbox::CommandExecutor::LooksLikeServer({{"main.py", "print('flask')"}}));
    CHECK_FALSE(sandbox::CommandExecutor::LooksLikeServer({{"README.md", "from flask import Flask"}}));
}

TEST_CASE("Execute clamps the timeout for server frameworks") {
    testing::FakeRuntime runtime;
    sandbox::CommandExecutor executor(runtime, std::chrono::seconds(60));

    executor.Execute("s", {{"app.py", "from fastapi import FastAPI"}}, "app.py", std::chrono::seconds(540));
    executor.Execute("s", {{"main.py", "print(1)"}}, "main.py", std::chrono::seconds(540));
    executor.Execute("s", {{"app.py", "import flask"}}, "app.py", std::chrono::seconds(10));

    REQUIRE(runtime.execs.size() == 3);
    CHECK(runtime.execs[0].timeout == std::chrono::seconds(60));
    CHECK(runtime.execs[1].timeout == std::chrono::seconds(540));
    CHECK(runtime.execs[2].timeout == std::chrono::seconds(10));
}

TEST_CASE("GUI failures get a note appended to the original stderr") {
    testing::FakeRuntime runtime;
    runtime.on_exec = [](const std::vector<std::string>&) {
        return testing::Result(1, "", "_tkinter.TclError: no display name and no $DISPLAY environment variable");
    };
    sandbox::CommandExecutor executor(runtime, std::chrono::seconds(60));

    const auto result = executor.Execute("s", {{"main.py", "import tkinter"}}, "main.py", std::chrono::seconds(5));
    CHECK(result.exit_code == 1);
    CHECK(result.error.rfind("_tkinter.TclError: no display name", 0) == 0);
    CHECK(result.error.find("requires GUI support") != std::string::npos);
}

TEST_CASE("ordinary failures keep stderr verbatim") {
    const std::string syntax_error =
        "  File \"main.py\", line 1\n    print(\n         ^\nSyntaxError: '(' was never closed";
    testing::FakeRuntime runtime;
    runtime.on_exec = [&syntax_error](const std::vector<std::string>&) {
        return testing::Result(1, "", syntax_error);
    };
    sandbox::CommandExecutor executor(runtime, std::chrono::seconds(60));

    const auto result = executor.Execute("s", {{"main.py", "print("}}, "main.py", std::chrono::seconds(5));
    CHECK(result.exit_code == 1);
    CHECK_FALSE(result.timed_out);
    CHECK(result.error == syntax_error);
}

TEST_CASE("timeouts come back as data with the reserved exit code") {
    testing::FakeRuntime runtime;
    runtime.on_exec = [](const std::vector<std::string>&) { return sandbox::TimeoutResult("partial"); };
    sandbox::CommandExecutor executor(runtime, std::chrono::seconds(60));

    const auto result = executor.Execute("s", {{"main.py", "import tkinter\nwhile True: pass"}}, "main.py",
                                         std::chrono::seconds(1));
    CHECK(result.timed_out);
    CHECK(result.exit_code == sandbox::kTimeoutExitCode);
    CHECK(result.output == "partial");
    CHECK(result.error.find("GUI") == std::string::npos);
    CHECK_FALSE(result.Succeeded());
}
