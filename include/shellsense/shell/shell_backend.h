#pragma once

#include <shellsense/completion_types.h>
#include <shellsense/logger.h>
#include <shellsense/process_runner.h>
#include <shellsense/shell_environment.h>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace shellsense {

/**
 * Collaborators shared by a backend and its command resolvers
 */
struct BackendServices {
    ProcessRunner& runner;
    const ShellEnvironment& environment;
    Logger& logger;
    std::chrono::milliseconds commandTimeout{500};
    std::filesystem::path etcHostsPath = "/etc/hosts";
};

/**
 * Source of shell-aware completions.
 *
 * resolve() returns only candidates whose text starts with the relevant part
 * of the current word: the basename for paths, the name without '$' for
 * variables, the whole word otherwise. Comparison is case-sensitive.
 * Failures of external sources yield fewer candidates, never an exception.
 */
class ShellBackend {
public:
    virtual ~ShellBackend() = default;

    virtual std::string_view name() const = 0;

    /**
     * One-time setup: PATH scan and native facility checks.
     * resolve() initializes on first use if this was not called.
     */
    virtual void initialize() = 0;

    virtual std::vector<CompletionCandidate> resolve(const CompletionContext& context) = 0;

    virtual std::vector<std::string> listBuiltins() const = 0;
};

} // namespace shellsense
