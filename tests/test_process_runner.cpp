#include <catch2/catch_test_macros.hpp>
#include <shellsense/process_runner.h>
#include "TemporaryDirectory.h"

using namespace shellsense;
using namespace std::chrono_literals;

namespace {

ShellEnvironment systemEnvironment() {
    return ShellEnvironment(std::map<std::string, std::string>{{"PATH", "/usr/bin:/bin"}, {"GREETING", "hello"}});
}

ProcessRequest requestFor(std::vector<std::string> argv, std::chrono::milliseconds timeout = 5000ms) {
    ProcessRequest request;
    request.argv = std::move(argv);
    request.timeout = timeout;
    return request;
}

} // namespace

TEST_CASE("PosixProcessRunner runs commands", "[process]") {
    PosixProcessRunner runner(systemEnvironment());

    SECTION("Output and exit code") {
        auto result = runner.run(requestFor({"sh", "-c", "echo one; echo two; echo oops >&2; exit 3"}));
        REQUIRE(result.exited());
        REQUIRE(result.exitCode == 3);
        REQUIRE_FALSE(result.isOk());
        REQUIRE(result.output == "one\ntwo\n");
        REQUIRE(result.lines() == std::vector<std::string>{"one", "two"});
    }

    SECTION("Children see the environment snapshot") {
        auto result = runner.run(requestFor({"sh", "-c", "echo $GREETING"}));
        REQUIRE(result.isOk());
        REQUIRE(result.output == "hello\n");
    }

    SECTION("Input is written to stdin") {
        auto request = requestFor({"cat"});
        request.input = "alpha\nbeta\n";
        auto result = runner.run(request);
        REQUIRE(result.isOk());
        REQUIRE(result.output == "alpha\nbeta\n");
    }

    SECTION("Working directory") {
        TemporaryDirectory directory;
        auto request = requestFor({"pwd"});
        request.workingDirectory = directory.getPath();
        auto result = runner.run(request);
        REQUIRE(result.isOk());
        REQUIRE(result.lines() == std::vector<std::string>{std::filesystem::canonical(directory.getPath()).string()});
    }

    SECTION("Slow commands time out") {
        auto start = std::chrono::steady_clock::now();
        auto result = runner.run(requestFor({"sleep", "5"}, 100ms));
        REQUIRE(result.status == ProcessResult::Status::TimedOut);
        REQUIRE(std::chrono::steady_clock::now() - start < 3s);
    }

    SECTION("Missing executables fail to launch") {
        auto result = runner.run(requestFor({"shellsense-no-such-command"}));
        REQUIRE(result.status == ProcessResult::Status::LaunchFailed);
        REQUIRE_FALSE(result.isOk());
    }

    SECTION("Empty argv") {
        auto result = runner.run(ProcessRequest{});
        REQUIRE(result.status == ProcessResult::Status::LaunchFailed);
    }
}

TEST_CASE("PosixProcessRunner caps output", "[process]") {
    PosixProcessRunner runner(systemEnvironment(), 4);
    auto result = runner.run(requestFor({"sh", "-c", "echo hello world"}));
    REQUIRE(result.isOk());
    REQUIRE(result.output == "hell");
}

TEST_CASE("ProcessResult::lines", "[process]") {
    ProcessResult result;
    result.output = "first\r\n\nsecond\nthird";
    REQUIRE(result.lines() == std::vector<std::string>{"first", "second", "third"});

    result.output.clear();
    REQUIRE(result.lines().empty());
}
