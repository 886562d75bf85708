#pragma once

#include <shellsense/shell/command_resolver.h>
#include <shellsense/shell/shell_backend.h>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace shellsense {

/**
 * Shell-independent backend
 *
 * Features:
 * - Command completion from PATH executables (scanned once) and builtins
 * - File and directory completion with ~ support
 * - Environment variable completion from the environment snapshot
 * - Options from `<command> --help`, or a static list of common options
 * - Command-specific resolvers for arguments
 */
class GenericShellBackend : public ShellBackend {
public:
    explicit GenericShellBackend(BackendServices services,
                                 CommandResolverRegistry resolvers = CommandResolverRegistry::withDefaults());

    // Disable copying
    GenericShellBackend(const GenericShellBackend&) = delete;
    GenericShellBackend& operator=(const GenericShellBackend&) = delete;

    std::string_view name() const override { return "generic"; }
    void initialize() override;
    std::vector<CompletionCandidate> resolve(const CompletionContext& context) override;
    std::vector<std::string> listBuiltins() const override;

    /**
     * Rescan PATH, e.g. after new programs were installed
     */
    virtual void rehash();

    size_t getCachedCommandCount() const { return this->cachedCommands.size(); }
    CommandResolverRegistry& getResolvers() { return this->resolvers; }

protected:
    virtual std::vector<CompletionCandidate> resolveCommands(const CompletionContext& context);
    virtual std::vector<CompletionCandidate> resolveArguments(const CompletionContext& context);
    std::vector<CompletionCandidate> resolvePaths(const CompletionContext& context);
    std::vector<CompletionCandidate> resolveOptions(const CompletionContext& context);
    std::vector<CompletionCandidate> resolveVariables(const CompletionContext& context) const;

    /**
     * Run a command through the runner with the configured timeout.
     * Returns the output lines, or nothing on any failure.
     */
    std::vector<std::string> runForLines(std::vector<std::string> argv, const std::string& workingDirectory = {}) const;

    BackendServices services;
    CommandResolverRegistry resolvers;
    bool initialized = false;

private:
    void scanPathDirectories();

    // Executables from PATH (sorted, no duplicates)
    std::set<std::string> cachedCommands;
    // Parsed `--help` output per command
    std::map<std::string, std::vector<std::pair<std::string, std::string>>> helpOptions;
};

/**
 * Builtins common to POSIX shells; shell keywords are not included
 */
const std::vector<std::string>& commonShellBuiltins();

} // namespace shellsense
