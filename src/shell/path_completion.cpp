#include <shellsense/shell/path_completion.h>
#include <shellsense/command_line.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace shellsense {

namespace fs = std::filesystem;

namespace {

bool needsEscape(char c) {
    switch (c) {
        case ' ': case '\t': case '\\': case '\'': case '"': case '$': case '`':
        case '&': case ';': case '|': case '<': case '>': case '(': case ')':
        case '*': case '?': case '[': case ']': case '!': case '#': case '{': case '}':
            return true;
        default:
            return false;
    }
}

} // namespace

std::string escapeForShell(std::string_view text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (needsEscape(c)) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::vector<CompletionCandidate> completePath(std::string_view word,
                                              const std::string& workingDirectory,
                                              const ShellEnvironment& environment,
                                              bool directoriesOnly) {
    std::vector<CompletionCandidate> candidates;

    const char quote = !word.empty() && (word[0] == '\'' || word[0] == '"') ? word[0] : '\0';
    const std::string value = unquote(word);

    std::string directoryPart;
    std::string basePrefix = value;
    if (auto slash = value.find_last_of('/'); slash != std::string::npos) {
        directoryPart = value.substr(0, slash + 1);
        basePrefix = value.substr(slash + 1);
    }

    // Raw text kept in front of each completed name
    std::string rawPrefix;
    if (auto rawSlash = word.find_last_of('/'); rawSlash != std::string_view::npos) {
        rawPrefix = std::string(word.substr(0, rawSlash + 1));
    } else if (quote != '\0') {
        rawPrefix = std::string(1, quote);
    }

    fs::path searchDirectory;
    if (directoryPart.empty()) {
        searchDirectory = workingDirectory.empty() ? fs::path(".") : fs::path(workingDirectory);
    } else {
        searchDirectory = fs::path(environment.expandTilde(directoryPart));
        if (searchDirectory.is_relative() && !workingDirectory.empty()) {
            searchDirectory = fs::path(workingDirectory) / searchDirectory;
        }
    }

    std::error_code ec;
    if (!fs::is_directory(searchDirectory, ec)) {
        return candidates;
    }

    const bool showHidden = !basePrefix.empty() && basePrefix[0] == '.';
    std::vector<std::pair<std::string, bool>> entries;
    fs::directory_iterator it(searchDirectory, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.empty() || (name[0] == '.' && !showHidden)) {
            continue;
        }
        if (!startsWith(name, basePrefix)) {
            continue;
        }
        std::error_code typeError;
        bool isDirectory = it->is_directory(typeError);
        if (directoriesOnly && !isDirectory) {
            continue;
        }
        entries.emplace_back(std::move(name), isDirectory);
    }

    std::sort(entries.begin(), entries.end());

    for (const auto& [name, isDirectory] : entries) {
        std::string completedName = quote != '\0' ? name : escapeForShell(name);
        std::string text = rawPrefix + completedName;
        if (isDirectory) {
            text += '/';
        } else if (quote != '\0') {
            text += quote;
        }

        CompletionCandidate candidate = makeCandidate(
            std::move(text),
            isDirectory ? "directory" : "file",
            isDirectory ? CompletionCategory::Directory : CompletionCategory::File,
            isDirectory ? 9 : 1);
        candidate.display = isDirectory ? name + "/" : name;
        candidate.metadata["path"] = (searchDirectory / name).string();
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

} // namespace shellsense
