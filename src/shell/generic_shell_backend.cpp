#include <shellsense/shell/generic_shell_backend.h>
#include <shellsense/shell/default_resolvers.h>
#include <shellsense/shell/path_completion.h>
#include <shellsense/command_line.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace shellsense {

namespace {

struct StaticOption {
    const char* option;
    const char* description;
};

const StaticOption commonOptions[] = {
    {"--help", "Show help"},
    {"-h", "Show help"},
    {"--version", "Show version"},
    {"-v", "Verbose output"},
    {"--verbose", "Verbose output"},
    {"-q", "Quiet mode"},
    {"--quiet", "Quiet mode"},
    {"-f", "Force"},
    {"--force", "Force operation"}
};

constexpr size_t maxVariableDescription = 50;

} // namespace

const std::vector<std::string>& commonShellBuiltins() {
    static const std::vector<std::string> builtins = {
        ".", "[", "alias", "bg", "break", "cd", "continue", "declare", "echo",
        "eval", "exec", "exit", "export", "false", "fg", "jobs", "kill", "local",
        "pwd", "readonly", "return", "set", "shift", "source", "test", "true",
        "typeset", "unalias", "unset", "wait"
    };
    return builtins;
}

GenericShellBackend::GenericShellBackend(BackendServices services, CommandResolverRegistry resolvers)
    : services(std::move(services))
    , resolvers(std::move(resolvers))
{
}

void GenericShellBackend::initialize() {
    if (this->initialized) {
        return;
    }
    this->scanPathDirectories();
    this->initialized = true;
}

void GenericShellBackend::rehash() {
    this->cachedCommands.clear();
    this->helpOptions.clear();
    this->scanPathDirectories();
    this->initialized = true;
}

void GenericShellBackend::scanPathDirectories() {
    const auto directories = this->services.environment.getPathDirectories();
    if (directories.empty()) {
        this->services.logger.debug("ShellBackend: PATH is empty or not set");
        return;
    }

    for (const auto& directory : directories) {
        std::error_code ec;
        if (!fs::is_directory(directory, ec)) {
            continue;
        }

        fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::string filename = it->path().filename().string();

            // Skip hidden files
            if (filename.empty() || filename[0] == '.') {
                continue;
            }
            if (isExecutableFile(it->path())) {
                this->cachedCommands.insert(std::move(filename));
            }
        }
    }

    this->services.logger.debug("ShellBackend: cached {} commands from PATH", this->cachedCommands.size());
}

std::vector<std::string> GenericShellBackend::listBuiltins() const {
    return commonShellBuiltins();
}

std::vector<CompletionCandidate> GenericShellBackend::resolve(const CompletionContext& context) {
    if (!this->initialized) {
        this->initialize();
    }

    switch (context.slot) {
        case CompletionSlot::Variable: return this->resolveVariables(context);
        case CompletionSlot::Option: return this->resolveOptions(context);
        case CompletionSlot::Path: return this->resolvePaths(context);
        case CompletionSlot::Command: return this->resolveCommands(context);
        case CompletionSlot::Argument: return this->resolveArguments(context);
    }
    return {};
}

std::vector<CompletionCandidate> GenericShellBackend::resolveCommands(const CompletionContext& context) {
    std::vector<CompletionCandidate> candidates;
    const std::string prefix = unquote(context.currentWord);

    std::vector<std::string> builtins = this->listBuiltins();
    std::sort(builtins.begin(), builtins.end());
    builtins.erase(std::unique(builtins.begin(), builtins.end()), builtins.end());

    for (const auto& builtin : builtins) {
        if (startsWith(builtin, prefix)) {
            candidates.push_back(makeCandidate(builtin, "builtin", CompletionCategory::Command, 10));
        }
    }

    // Search in cached commands (already sorted); builtins win on duplicates
    for (auto it = this->cachedCommands.lower_bound(prefix); it != this->cachedCommands.end() && startsWith(*it, prefix); ++it) {
        if (!std::binary_search(builtins.begin(), builtins.end(), *it)) {
            candidates.push_back(makeCandidate(*it, "command", CompletionCategory::Command, 5));
        }
    }
    return candidates;
}

std::vector<CompletionCandidate> GenericShellBackend::resolvePaths(const CompletionContext& context) {
    if (context.position() > 0) {
        const CommandResolver* resolver = this->resolvers.find(context.commandName);
        if (resolver && resolver->replacesFileCompletions && resolver->arguments) {
            return resolver->arguments(context, this->services);
        }
    }
    return completePath(context.currentWord, context.workingDirectory, this->services.environment);
}

std::vector<CompletionCandidate> GenericShellBackend::resolveArguments(const CompletionContext& context) {
    const CommandResolver* resolver = this->resolvers.find(context.commandName);
    if (resolver && resolver->replacesFileCompletions && resolver->arguments) {
        return resolver->arguments(context, this->services);
    }

    std::vector<CompletionCandidate> candidates = completePath(context.currentWord, context.workingDirectory, this->services.environment);
    if (resolver && resolver->arguments) {
        auto specific = resolver->arguments(context, this->services);
        candidates.insert(candidates.end(),
                          std::make_move_iterator(specific.begin()),
                          std::make_move_iterator(specific.end()));
    }
    return candidates;
}

std::vector<CompletionCandidate> GenericShellBackend::resolveOptions(const CompletionContext& context) {
    std::vector<CompletionCandidate> candidates;
    const std::string prefix = unquote(context.currentWord);

    if (const CommandResolver* resolver = this->resolvers.find(context.commandName); resolver && resolver->options) {
        return resolver->options(context, this->services);
    }

    const std::string command = unquote(context.commandName);
    if (!command.empty()) {
        auto cached = this->helpOptions.find(command);
        if (cached == this->helpOptions.end()) {
            std::vector<std::pair<std::string, std::string>> parsed;
            if (this->services.environment.findExecutable(command)) {
                ProcessRequest request;
                request.argv = {command, "--help"};
                request.timeout = this->services.commandTimeout;
                request.workingDirectory = context.workingDirectory;
                ProcessResult result = this->services.runner.run(request);
                if (result.exited()) {
                    parsed = parseHelpOptions(result.output);
                } else {
                    this->services.logger.debug("ShellBackend: '{} --help' did not finish", command);
                }
            }
            cached = this->helpOptions.emplace(command, std::move(parsed)).first;
        }

        if (!cached->second.empty()) {
            for (const auto& [option, description] : cached->second) {
                if (startsWith(option, prefix)) {
                    candidates.push_back(makeCandidate(option, description, CompletionCategory::Option, 6));
                }
            }
            return candidates;
        }
    }

    for (const auto& entry : commonOptions) {
        if (startsWith(entry.option, prefix)) {
            candidates.push_back(makeCandidate(entry.option, entry.description, CompletionCategory::Option, 5));
        }
    }
    return candidates;
}

std::vector<CompletionCandidate> GenericShellBackend::resolveVariables(const CompletionContext& context) const {
    std::vector<CompletionCandidate> candidates;
    std::string_view word = context.currentWord;
    if (!word.empty() && word[0] == '$') {
        word.remove_prefix(1);
    }
    const bool braced = !word.empty() && word[0] == '{';
    if (braced) {
        word.remove_prefix(1);
    }

    for (const auto& [name, value] : this->services.environment.getVariables()) {
        if (!startsWith(name, word)) {
            continue;
        }
        std::string description = value.size() > maxVariableDescription
            ? value.substr(0, maxVariableDescription) + "..."
            : value;
        std::string text = braced ? "${" + name + "}" : "$" + name;
        CompletionCandidate candidate = makeCandidate(std::move(text), std::move(description), CompletionCategory::Variable, 3);
        candidate.metadata["value"] = value;
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

std::vector<std::string> GenericShellBackend::runForLines(std::vector<std::string> argv, const std::string& workingDirectory) const {
    ProcessRequest request;
    request.argv = std::move(argv);
    request.timeout = this->services.commandTimeout;
    request.workingDirectory = workingDirectory;
    ProcessResult result = this->services.runner.run(request);
    if (!result.isOk()) {
        this->services.logger.debug("ShellBackend: '{}' failed (exit code {})", request.argv[0], result.exitCode);
        return {};
    }
    return result.lines();
}

} // namespace shellsense
