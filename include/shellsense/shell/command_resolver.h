#pragma once

#include <shellsense/shell/shell_backend.h>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

namespace shellsense {

using ResolverFunction = std::function<std::vector<CompletionCandidate>(const CompletionContext&, const BackendServices&)>;

/**
 * Completions specific to one command, e.g. git branches or npm scripts
 */
struct CommandResolver {
    ResolverFunction arguments;
    ResolverFunction options;               // optional; replaces --help parsing when set
    bool replacesFileCompletions = false;   // true for commands like cd that only take directories
};

/**
 * Map from command name to resolver. Lookups use the basename of the command
 * word, so "/usr/bin/git" finds the "git" resolver.
 */
class CommandResolverRegistry {
public:
    void add(const std::string& command, CommandResolver resolver);
    void add(std::initializer_list<std::string> commands, const CommandResolver& resolver);
    void remove(const std::string& command);

    const CommandResolver* find(const std::string& commandWord) const;
    bool empty() const { return this->resolvers.empty(); }

    /**
     * Registry with resolvers for git, npm/yarn/pnpm, docker/podman, kill,
     * ssh/scp/rsync/sftp and cd/pushd
     */
    static CommandResolverRegistry withDefaults();

private:
    std::map<std::string, CommandResolver> resolvers;
};

} // namespace shellsense
