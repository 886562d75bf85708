#include <shellsense/shell/bash_shell_backend.h>
#include <shellsense/shell/path_completion.h>
#include <shellsense/command_line.h>

#include <set>

namespace shellsense {

namespace {

// compgen -A command also lists reserved words, which are not commands to complete
const std::set<std::string> shellKeywords = {
    "!", "[[", "]]", "{", "}", "case", "coproc", "do", "done", "elif", "else",
    "esac", "fi", "for", "function", "if", "in", "select", "then", "time",
    "until", "while"
};

} // namespace

void BashShellBackend::initialize() {
    if (this->initialized) {
        return;
    }
    GenericShellBackend::initialize();

    ProcessRequest check;
    check.argv = {"bash", "--norc", "--noprofile", "-c", "compgen -A command -- ls"};
    check.timeout = this->services.commandTimeout;
    this->compgenAvailable = this->services.runner.run(check).isOk();
    this->services.logger.debug("BashShellBackend: compgen {}", this->compgenAvailable ? "available" : "not available");
}

std::vector<std::string> BashShellBackend::listBuiltins() const {
    std::vector<std::string> builtins = commonShellBuiltins();
    builtins.insert(builtins.end(), {
        "bind", "builtin", "caller", "command", "compgen", "complete", "compopt",
        "dirs", "disown", "enable", "getopts", "hash", "help", "history", "let",
        "logout", "mapfile", "popd", "printf", "pushd", "read", "readarray",
        "shopt", "suspend", "times", "trap", "type", "ulimit", "umask"
    });
    return builtins;
}

std::vector<std::string> BashShellBackend::compgen(const std::string& action, const std::string& prefix, const std::string& workingDirectory) const {
    // The prefix is passed as a positional parameter, never spliced into the script
    return this->runForLines({"bash", "--norc", "--noprofile", "-c", "compgen -A " + action + " -- \"$1\"", "bash", prefix},
                             workingDirectory);
}

std::vector<CompletionCandidate> BashShellBackend::resolveCommands(const CompletionContext& context) {
    std::vector<CompletionCandidate> candidates = GenericShellBackend::resolveCommands(context);
    if (!this->compgenAvailable) {
        return candidates;
    }

    const std::string prefix = unquote(context.currentWord);
    for (auto& name : this->compgen("command", prefix, context.workingDirectory)) {
        if (startsWith(name, prefix) && shellKeywords.count(name) == 0) {
            candidates.push_back(makeCandidate(std::move(name), "command", CompletionCategory::Command, 5));
        }
    }
    deduplicateByText(candidates);
    return candidates;
}

std::vector<CompletionCandidate> BashShellBackend::resolveArguments(const CompletionContext& context) {
    std::vector<CompletionCandidate> candidates = GenericShellBackend::resolveArguments(context);
    const std::string command = commandBaseName(context.commandName);
    if (!this->compgenAvailable || (command != "cd" && command != "pushd")) {
        return candidates;
    }

    const std::string prefix = unquote(context.currentWord);
    for (const auto& directory : this->compgen("directory", prefix, context.workingDirectory)) {
        if (!startsWith(directory, prefix)) {
            continue;
        }
        CompletionCandidate candidate = makeCandidate(escapeForShell(directory) + "/", "directory", CompletionCategory::Directory, 9);
        candidate.display = directory + "/";
        candidates.push_back(std::move(candidate));
    }
    deduplicateByText(candidates);
    return candidates;
}

} // namespace shellsense
