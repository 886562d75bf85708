#include <shellsense/shell/zsh_shell_backend.h>
#include <shellsense/command_line.h>

namespace shellsense {

void ZshShellBackend::initialize() {
    if (this->initialized) {
        return;
    }
    GenericShellBackend::initialize();
    this->loadCommandTable();
}

void ZshShellBackend::rehash() {
    GenericShellBackend::rehash();
    this->loadCommandTable();
}

void ZshShellBackend::loadCommandTable() {
    ProcessRequest request;
    request.argv = {"zsh", "-f", "-c", "print -rl -- ${(k)commands}"};
    request.timeout = this->services.commandTimeout;
    ProcessResult result = this->services.runner.run(request);

    this->zshAvailable = result.isOk();
    this->zshCommands.clear();
    if (!this->zshAvailable) {
        this->services.logger.debug("ZshShellBackend: zsh not available (exit code {})", result.exitCode);
        return;
    }
    for (auto& name : result.lines()) {
        this->zshCommands.insert(std::move(name));
    }
    this->services.logger.debug("ZshShellBackend: loaded {} commands from zsh", this->zshCommands.size());
}

std::vector<std::string> ZshShellBackend::listBuiltins() const {
    std::vector<std::string> builtins = commonShellBuiltins();
    builtins.insert(builtins.end(), {
        "autoload", "bindkey", "builtin", "chdir", "compadd", "compctl", "compdef",
        "dirs", "disable", "disown", "echotc", "echoti", "emulate", "enable", "fc",
        "float", "functions", "getln", "getopts", "hash", "history", "integer",
        "limit", "log", "logout", "popd", "print", "pushd", "pushln", "r", "read",
        "rehash", "sched", "setopt", "suspend", "times", "trap", "ttyctl", "type",
        "ulimit", "umask", "unfunction", "unhash", "unlimit", "unsetopt", "vared",
        "whence", "where", "which", "zcompile", "zformat", "zle", "zmodload",
        "zparseopts", "zstyle"
    });
    return builtins;
}

std::vector<CompletionCandidate> ZshShellBackend::resolveCommands(const CompletionContext& context) {
    std::vector<CompletionCandidate> candidates = GenericShellBackend::resolveCommands(context);
    if (!this->zshAvailable) {
        return candidates;
    }

    const std::string prefix = unquote(context.currentWord);
    for (auto it = this->zshCommands.lower_bound(prefix); it != this->zshCommands.end() && startsWith(*it, prefix); ++it) {
        candidates.push_back(makeCandidate(*it, "command", CompletionCategory::Command, 5));
    }
    deduplicateByText(candidates);
    return candidates;
}

} // namespace shellsense
