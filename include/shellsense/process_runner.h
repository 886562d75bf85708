#pragma once

#include <shellsense/shell_environment.h>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace shellsense {

struct ProcessRequest {
    std::vector<std::string> argv;           // argv[0] is looked up through PATH
    std::string input;                       // written to stdin, then stdin is closed
    std::chrono::milliseconds timeout{500};
    std::filesystem::path workingDirectory;  // empty = inherit
};

struct ProcessResult {
    enum class Status {
        Exited,
        Signaled,
        TimedOut,
        LaunchFailed
    };

    Status status = Status::LaunchFailed;
    int exitCode = -1;
    std::string output;                      // stdout only; stderr is discarded

    bool exited() const { return this->status == Status::Exited; }
    bool isOk() const { return this->exited() && this->exitCode == 0; }

    /**
     * Output split on newlines, empty lines and trailing '\r' removed
     */
    std::vector<std::string> lines() const;
};

/**
 * Runs short-lived external commands with a hard timeout.
 * Implementations never throw; every failure is reported through ProcessResult.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const ProcessRequest& request) = 0;
};

/**
 * fork/exec implementation with pipes for stdin and stdout.
 * The child gets its own process group so a timeout can kill the whole tree.
 */
class PosixProcessRunner : public ProcessRunner {
public:
    /**
     * @param environment variables passed to children and used for PATH lookup
     * @param maxOutputBytes output beyond this size is discarded
     */
    explicit PosixProcessRunner(ShellEnvironment environment, size_t maxOutputBytes = 4 * 1024 * 1024);

    // Disable copying
    PosixProcessRunner(const PosixProcessRunner&) = delete;
    PosixProcessRunner& operator=(const PosixProcessRunner&) = delete;

    ProcessResult run(const ProcessRequest& request) override;

private:
    ShellEnvironment environment;
    size_t maxOutputBytes;
};

} // namespace shellsense
