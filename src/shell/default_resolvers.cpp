#include <shellsense/shell/default_resolvers.h>
#include <shellsense/shell/path_completion.h>
#include <shellsense/command_line.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <hv/json.hpp>

using json = nlohmann::json;

namespace shellsense {

namespace {

const std::vector<std::string> gitSubcommands = {
    "add", "bisect", "blame", "branch", "checkout", "cherry-pick", "clone",
    "commit", "config", "diff", "fetch", "grep", "init", "log", "merge", "mv",
    "pull", "push", "rebase", "reflog", "remote", "reset", "restore", "revert",
    "rm", "show", "stash", "status", "switch", "tag"
};
const std::set<std::string> gitRefCommands = {"checkout", "merge", "rebase", "branch", "diff", "log", "switch"};
const std::set<std::string> gitFileCommands = {"add", "rm", "diff", "restore"};

const std::map<std::string, std::vector<std::string>> packageRunnerCommands = {
    {"npm", {"audit", "ci", "init", "install", "publish", "run", "start", "test", "uninstall", "update"}},
    {"yarn", {"add", "init", "install", "publish", "remove", "run", "start", "test", "upgrade", "why"}},
    {"pnpm", {"add", "exec", "init", "install", "publish", "remove", "run", "start", "test", "update"}}
};

const std::vector<std::string> containerSubcommands = {
    "build", "container", "exec", "images", "inspect", "logs", "network", "ps",
    "pull", "push", "restart", "rm", "rmi", "run", "start", "stop", "volume"
};
const std::set<std::string> containerNameCommands = {"exec", "stop", "start", "restart", "rm", "logs", "inspect"};
const std::set<std::string> imageCommands = {"run", "rmi"};

constexpr size_t maxProcessCandidates = 20;
constexpr size_t maxDescriptionLength = 50;

std::string trim(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(start, end - start));
}

std::vector<std::string> splitFields(std::string_view line) {
    std::vector<std::string> fields;
    std::istringstream stream{std::string(line)};
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    return fields;
}

std::vector<std::string> splitLines(std::string_view content) {
    std::vector<std::string> lines;
    std::istringstream stream{std::string(content)};
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string truncateDescription(const std::string& text) {
    if (text.size() <= maxDescriptionLength) {
        return text;
    }
    return text.substr(0, maxDescriptionLength) + "...";
}

std::optional<std::string> readTextFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

ProcessResult runCommand(const BackendServices& services, std::vector<std::string> argv, const std::string& workingDirectory) {
    ProcessRequest request;
    request.argv = std::move(argv);
    request.timeout = services.commandTimeout;
    request.workingDirectory = workingDirectory;
    ProcessResult result = services.runner.run(request);
    if (!result.isOk()) {
        services.logger.debug("CommandResolver: '{}' failed (exit code {})", request.argv[0], result.exitCode);
    }
    return result;
}

std::vector<std::string> runForLines(const BackendServices& services, std::vector<std::string> argv, const std::string& workingDirectory) {
    ProcessResult result = runCommand(services, std::move(argv), workingDirectory);
    if (!result.isOk()) {
        return {};
    }
    return result.lines();
}

void appendMatching(std::vector<CompletionCandidate>& candidates,
                    const std::vector<std::string>& values,
                    const std::string& prefix,
                    const std::string& description,
                    CompletionCategory category,
                    int priority) {
    for (const auto& value : values) {
        if (!value.empty() && startsWith(value, prefix)) {
            candidates.push_back(makeCandidate(value, description, category, priority));
        }
    }
}

std::string parsePorcelainPath(const std::string& line) {
    if (line.size() <= 3) {
        return {};
    }
    std::string path = line.substr(3);
    if (auto arrow = path.find(" -> "); arrow != std::string::npos) {
        path = path.substr(arrow + 4);
    }
    if (path.size() >= 2 && path.front() == '"' && path.back() == '"') {
        path = unquote(path);
    }
    return path;
}

bool isOptionCharacter(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

} // namespace

std::vector<CompletionCandidate> resolveGit(const CompletionContext& context, const BackendServices& services) {
    std::vector<CompletionCandidate> candidates;
    const std::string prefix = unquote(context.currentWord);

    if (context.position() == 1) {
        appendMatching(candidates, gitSubcommands, prefix, "git subcommand", CompletionCategory::Argument, 8);
        return candidates;
    }

    const std::string subcommand = unquote(context.lastWord());
    if (gitRefCommands.count(subcommand) > 0) {
        auto refs = runForLines(services,
                                {"git", "for-each-ref", "--format=%(refname:short)", "refs/heads", "refs/remotes", "refs/tags"},
                                context.workingDirectory);
        appendMatching(candidates, refs, prefix, "git branch", CompletionCategory::Argument, 8);
    }
    if (gitFileCommands.count(subcommand) > 0) {
        std::vector<std::string> files;
        for (const auto& line : runForLines(services, {"git", "status", "--porcelain"}, context.workingDirectory)) {
            files.push_back(parsePorcelainPath(line));
        }
        appendMatching(candidates, files, prefix, "modified file", CompletionCategory::File, 8);
    }

    deduplicateByText(candidates);
    return candidates;
}

std::vector<std::pair<std::string, std::string>> parsePackageScripts(std::string_view packageJson) {
    std::vector<std::pair<std::string, std::string>> scripts;
    json document = json::parse(packageJson.begin(), packageJson.end(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return scripts;
    }
    auto it = document.find("scripts");
    if (it == document.end() || !it->is_object()) {
        return scripts;
    }
    for (auto script = it->begin(); script != it->end(); ++script) {
        if (script.value().is_string()) {
            scripts.emplace_back(script.key(), script.value().get<std::string>());
        }
    }
    return scripts;
}

std::vector<CompletionCandidate> resolvePackageScripts(const CompletionContext& context, const BackendServices& services) {
    std::vector<CompletionCandidate> candidates;
    const std::string prefix = unquote(context.currentWord);
    const std::string runner = commandBaseName(context.commandName);

    const bool atSubcommand = context.position() == 1;
    const bool afterRun = context.position() >= 2 && unquote(context.lastWord()) == "run";
    if (!atSubcommand && !afterRun) {
        return candidates;
    }

    if (atSubcommand) {
        auto commands = packageRunnerCommands.find(runner);
        if (commands != packageRunnerCommands.end()) {
            appendMatching(candidates, commands->second, prefix, runner + " command", CompletionCategory::Argument, 8);
        }
    }

    std::filesystem::path packageFile = std::filesystem::path(context.workingDirectory) / "package.json";
    auto content = readTextFile(packageFile);
    if (!content) {
        services.logger.debug("CommandResolver: no package.json in '{}'", context.workingDirectory);
    } else {
        for (const auto& [name, command] : parsePackageScripts(*content)) {
            if (!startsWith(name, prefix)) {
                continue;
            }
            CompletionCandidate candidate = makeCandidate(name, truncateDescription(command), CompletionCategory::Argument, 9);
            candidate.metadata["script"] = command;
            candidates.push_back(std::move(candidate));
        }
    }

    deduplicateByText(candidates);
    return candidates;
}

std::vector<CompletionCandidate> resolveContainers(const CompletionContext& context, const BackendServices& services) {
    std::vector<CompletionCandidate> candidates;
    const std::string prefix = unquote(context.currentWord);
    const std::string tool = commandBaseName(context.commandName);

    if (context.position() == 1) {
        appendMatching(candidates, containerSubcommands, prefix, tool + " command", CompletionCategory::Argument, 8);
        return candidates;
    }

    const std::string subcommand = unquote(context.lastWord());
    if (containerNameCommands.count(subcommand) > 0) {
        auto names = runForLines(services, {tool, "ps", "--format", "{{.Names}}"}, context.workingDirectory);
        appendMatching(candidates, names, prefix, "container", CompletionCategory::Argument, 8);
    } else if (imageCommands.count(subcommand) > 0) {
        std::vector<std::string> images;
        for (auto& image : runForLines(services, {tool, "images", "--format", "{{.Repository}}:{{.Tag}}"}, context.workingDirectory)) {
            if (image.find("<none>") == std::string::npos) {
                images.push_back(std::move(image));
            }
        }
        appendMatching(candidates, images, prefix, "image", CompletionCategory::Argument, 8);
    }

    deduplicateByText(candidates);
    return candidates;
}

std::vector<std::pair<std::string, std::string>> parseProcessList(std::string_view output) {
    std::vector<std::pair<std::string, std::string>> processes;
    for (const auto& rawLine : splitLines(output)) {
        std::string line = trim(rawLine);
        size_t digits = 0;
        while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits]))) {
            ++digits;
        }
        if (digits == 0 || digits == line.size() || !std::isspace(static_cast<unsigned char>(line[digits]))) {
            continue;
        }
        std::string command = trim(std::string_view(line).substr(digits));
        if (!command.empty()) {
            processes.emplace_back(line.substr(0, digits), std::move(command));
        }
    }
    return processes;
}

std::vector<CompletionCandidate> resolveProcesses(const CompletionContext& context, const BackendServices& services) {
    std::vector<CompletionCandidate> candidates;
    const std::string prefix = unquote(context.currentWord);

    ProcessResult result = runCommand(services, {"ps", "-eo", "pid,comm"}, context.workingDirectory);
    if (!result.isOk()) {
        return candidates;
    }

    for (const auto& [pid, command] : parseProcessList(result.output)) {
        if (candidates.size() >= maxProcessCandidates) {
            break;
        }
        if (!startsWith(pid, prefix)) {
            continue;
        }
        CompletionCandidate candidate = makeCandidate(pid, command, CompletionCategory::Argument, 7);
        candidate.metadata["command"] = command;
        candidates.push_back(std::move(candidate));
    }

    deduplicateByText(candidates);
    return candidates;
}

std::vector<std::string> parseKnownHosts(std::string_view content) {
    std::vector<std::string> hosts;
    std::set<std::string> seen;
    for (const auto& rawLine : splitLines(content)) {
        std::string line = trim(rawLine);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto fields = splitFields(line);
        size_t hostField = 0;
        if (fields[0][0] == '@') {
            // @cert-authority / @revoked marker precedes the host list
            hostField = 1;
        }
        if (hostField >= fields.size()) {
            continue;
        }

        std::istringstream hostList(fields[hostField]);
        std::string host;
        while (std::getline(hostList, host, ',')) {
            if (host.empty() || host[0] == '|' || host[0] == '[') {
                continue;
            }
            if (host.find_first_of("*?") != std::string::npos) {
                continue;
            }
            if (seen.insert(host).second) {
                hosts.push_back(host);
            }
        }
    }
    return hosts;
}

std::vector<std::string> parseSshConfigHosts(std::string_view content) {
    std::vector<std::string> hosts;
    std::set<std::string> seen;
    for (const auto& rawLine : splitLines(content)) {
        std::string line = trim(rawLine);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        // "Host=alias" is equivalent to "Host alias"
        if (auto equals = line.find('='); equals != std::string::npos && equals < line.find_first_of(" \t")) {
            line[equals] = ' ';
        }
        auto fields = splitFields(line);
        if (fields.size() < 2 || toLowerAscii(fields[0]) != "host") {
            continue;
        }
        for (size_t i = 1; i < fields.size(); ++i) {
            const std::string& pattern = fields[i];
            if (pattern[0] == '!' || pattern.find_first_of("*?") != std::string::npos) {
                continue;
            }
            if (seen.insert(pattern).second) {
                hosts.push_back(pattern);
            }
        }
    }
    return hosts;
}

std::vector<std::string> parseEtcHosts(std::string_view content) {
    std::vector<std::string> hosts;
    std::set<std::string> seen;
    for (auto line : splitLines(content)) {
        if (auto comment = line.find('#'); comment != std::string::npos) {
            line.erase(comment);
        }
        auto fields = splitFields(line);
        for (size_t i = 1; i < fields.size(); ++i) {
            if (seen.insert(fields[i]).second) {
                hosts.push_back(fields[i]);
            }
        }
    }
    return hosts;
}

std::vector<CompletionCandidate> resolveHosts(const CompletionContext& context, const BackendServices& services) {
    std::vector<CompletionCandidate> candidates;
    std::string word = unquote(context.currentWord);
    if (word.find(':') != std::string::npos) {
        // host:path is a remote path, not a host name
        return candidates;
    }

    std::string userPrefix;
    if (auto at = word.find('@'); at != std::string::npos) {
        userPrefix = word.substr(0, at + 1);
        word = word.substr(at + 1);
    }

    auto addHosts = [&](const std::vector<std::string>& hosts, const std::string& description, int priority) {
        for (const auto& host : hosts) {
            if (startsWith(host, word)) {
                candidates.push_back(makeCandidate(userPrefix + host, description, CompletionCategory::Hostname, priority));
            }
        }
    };

    const std::filesystem::path sshDirectory = services.environment.getHomeDirectory() / ".ssh";
    if (auto config = readTextFile(sshDirectory / "config")) {
        addHosts(parseSshConfigHosts(*config), "ssh config", 9);
    }
    if (auto knownHosts = readTextFile(sshDirectory / "known_hosts")) {
        addHosts(parseKnownHosts(*knownHosts), "known host", 8);
    }
    if (auto etcHosts = readTextFile(services.etcHostsPath)) {
        addHosts(parseEtcHosts(*etcHosts), "/etc/hosts", 7);
    }

    deduplicateByText(candidates);
    return candidates;
}

std::vector<CompletionCandidate> resolveDirectories(const CompletionContext& context, const BackendServices& services) {
    return completePath(context.currentWord, context.workingDirectory, services.environment, true);
}

std::vector<std::pair<std::string, std::string>> parseHelpOptions(std::string_view helpText) {
    std::vector<std::pair<std::string, std::string>> options;
    std::set<std::string> seen;

    for (const auto& rawLine : splitLines(helpText)) {
        std::string line = trim(rawLine);
        if (line.size() < 2 || line[0] != '-') {
            continue;
        }

        // Option names and description are separated by a run of two or more blanks
        std::string names = line;
        std::string description;
        size_t separator = line.find("  ");
        if (auto tab = line.find('\t'); tab != std::string::npos && tab < separator) {
            separator = tab;
        }
        if (separator != std::string::npos) {
            names = line.substr(0, separator);
            std::istringstream words(line.substr(separator));
            std::string word;
            while (words >> word) {
                if (!description.empty()) {
                    description += ' ';
                }
                description += word;
            }
        }

        for (size_t i = 0; i < names.size(); ++i) {
            bool atTokenStart = i == 0 || names[i - 1] == ' ' || names[i - 1] == ',' || names[i - 1] == '|' || names[i - 1] == '[';
            if (!atTokenStart || names[i] != '-') {
                continue;
            }
            size_t nameStart = i + 1;
            if (nameStart < names.size() && names[nameStart] == '-') {
                ++nameStart;
            }
            if (nameStart >= names.size() || !std::isalnum(static_cast<unsigned char>(names[nameStart]))) {
                continue;
            }
            size_t end = nameStart;
            while (end < names.size() && isOptionCharacter(names[end])) {
                ++end;
            }
            while (end > nameStart && names[end - 1] == '-') {
                --end;
            }
            std::string option = names.substr(i, end - i);
            if (seen.insert(option).second) {
                options.emplace_back(option, truncateDescription(description));
            }
            i = end;
        }
    }
    return options;
}

} // namespace shellsense
