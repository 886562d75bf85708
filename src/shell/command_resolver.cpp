#include <shellsense/shell/command_resolver.h>
#include <shellsense/shell/default_resolvers.h>
#include <shellsense/command_line.h>

namespace shellsense {

void CommandResolverRegistry::add(const std::string& command, CommandResolver resolver) {
    this->resolvers[command] = std::move(resolver);
}

void CommandResolverRegistry::add(std::initializer_list<std::string> commands, const CommandResolver& resolver) {
    for (const auto& command : commands) {
        this->resolvers[command] = resolver;
    }
}

void CommandResolverRegistry::remove(const std::string& command) {
    this->resolvers.erase(command);
}

const CommandResolver* CommandResolverRegistry::find(const std::string& commandWord) const {
    if (commandWord.empty()) {
        return nullptr;
    }
    auto it = this->resolvers.find(commandBaseName(commandWord));
    if (it == this->resolvers.end()) {
        return nullptr;
    }
    return &it->second;
}

CommandResolverRegistry CommandResolverRegistry::withDefaults() {
    CommandResolverRegistry registry;
    registry.add("git", CommandResolver{resolveGit, nullptr, false});
    registry.add({"npm", "yarn", "pnpm"}, CommandResolver{resolvePackageScripts, nullptr, false});
    registry.add({"docker", "podman"}, CommandResolver{resolveContainers, nullptr, false});
    registry.add("kill", CommandResolver{resolveProcesses, nullptr, false});
    registry.add({"ssh", "scp", "rsync", "sftp"}, CommandResolver{resolveHosts, nullptr, false});
    registry.add({"cd", "pushd"}, CommandResolver{resolveDirectories, nullptr, true});
    return registry;
}

} // namespace shellsense
