#include <shellsense/history/shell_history_providers.h>

#include <cctype>
#include <charconv>
#include <system_error>

namespace shellsense {

namespace fs = std::filesystem;

namespace {

bool isBlank(std::string_view text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::optional<int64_t> parseInteger(std::string_view text) {
    int64_t value = 0;
    auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (error != std::errc() || end != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

// Split on '\n' without producing an element after a trailing newline
std::vector<std::string_view> splitLines(std::string_view content) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        std::string_view line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

bool isTimestampComment(std::string_view line) {
    if (line.size() < 2 || line[0] != '#') {
        return false;
    }
    return parseInteger(line.substr(1)).has_value();
}

HistoryEntry makeEntry(std::string command) {
    HistoryEntry entry;
    entry.command = std::move(command);
    return entry;
}

struct ZshMarker {
    int64_t timestamp = 0;
    int64_t duration = 0;
    std::string_view command;
};

// ": <epoch>:<duration>;<command>"
std::optional<ZshMarker> parseZshMarker(std::string_view line) {
    if (line.size() < 2 || line[0] != ':' || line[1] != ' ') {
        return std::nullopt;
    }
    size_t colon = line.find(':', 2);
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    size_t semicolon = line.find(';', colon + 1);
    if (semicolon == std::string_view::npos) {
        return std::nullopt;
    }
    auto timestamp = parseInteger(line.substr(2, colon - 2));
    auto duration = parseInteger(line.substr(colon + 1, semicolon - colon - 1));
    if (!timestamp || !duration) {
        return std::nullopt;
    }
    return ZshMarker{*timestamp, *duration, line.substr(semicolon + 1)};
}

// zsh writes bytes >= 0x83 as 0x83 followed by the byte xor 0x20
std::string unmetafy(std::string_view content) {
    std::string result;
    result.reserve(content.size());
    for (size_t i = 0; i < content.size(); ++i) {
        if (static_cast<unsigned char>(content[i]) == 0x83 && i + 1 < content.size()) {
            result.push_back(static_cast<char>(content[i + 1] ^ 0x20));
            ++i;
        } else {
            result.push_back(content[i]);
        }
    }
    return result;
}

std::string decodeFishText(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            if (text[i + 1] == 'n') {
                result.push_back('\n');
                ++i;
                continue;
            }
            if (text[i + 1] == '\\') {
                result.push_back('\\');
                ++i;
                continue;
            }
        }
        result.push_back(text[i]);
    }
    return result;
}

fs::path historyFileFromEnvironment(const ShellEnvironment& environment) {
    auto histfile = environment.get("HISTFILE");
    if (histfile && !histfile->empty()) {
        return environment.expandTilde(*histfile);
    }
    return {};
}

} // namespace

BashHistoryProvider::BashHistoryProvider(fs::path file, Logger& logger)
    : FileHistoryProvider("bash", std::move(file), logger)
{
}

std::vector<HistoryEntry> BashHistoryProvider::parse(std::string_view content) {
    std::vector<HistoryEntry> entries;
    std::string pending;
    bool continuing = false;

    for (auto line : splitLines(content)) {
        if (!continuing && (isBlank(line) || isTimestampComment(line))) {
            continue;
        }
        if (!line.empty() && line.back() == '\\') {
            pending.append(line.substr(0, line.size() - 1));
            pending.push_back('\n');
            continuing = true;
            continue;
        }
        pending.append(line);
        if (!isBlank(pending)) {
            entries.push_back(makeEntry(std::move(pending)));
        }
        pending.clear();
        continuing = false;
    }

    // File ended in the middle of a continued command
    if (continuing) {
        while (!pending.empty() && pending.back() == '\n') {
            pending.pop_back();
        }
        if (!isBlank(pending)) {
            entries.push_back(makeEntry(std::move(pending)));
        }
    }
    return entries;
}

fs::path BashHistoryProvider::locateFile(const ShellEnvironment& environment) {
    auto fromEnvironment = historyFileFromEnvironment(environment);
    if (!fromEnvironment.empty()) {
        return fromEnvironment;
    }
    return environment.getHomeDirectory() / ".bash_history";
}

ZshHistoryProvider::ZshHistoryProvider(fs::path file, Logger& logger)
    : FileHistoryProvider("zsh", std::move(file), logger)
{
}

std::vector<HistoryEntry> ZshHistoryProvider::parse(std::string_view content) {
    std::string decoded = unmetafy(content);
    std::vector<HistoryEntry> entries;
    std::optional<HistoryEntry> current;
    bool annotated = false;

    auto flush = [&]() {
        if (current && !isBlank(current->command)) {
            entries.push_back(std::move(*current));
        }
        current.reset();
    };

    for (auto line : splitLines(decoded)) {
        if (auto marker = parseZshMarker(line)) {
            flush();
            current = makeEntry(std::string(marker->command));
            current->timestamp = secondsToMilliseconds(marker->timestamp);
            current->duration = secondsToMilliseconds(marker->duration);
            annotated = true;
            continue;
        }
        if (current && annotated) {
            if (!current->command.empty() && current->command.back() == '\\') {
                current->command.pop_back();
            }
            current->command.push_back('\n');
            current->command.append(line);
            continue;
        }
        if (isBlank(line)) {
            continue;
        }
        flush();
        current = makeEntry(std::string(line));
        annotated = false;
    }
    flush();
    return entries;
}

fs::path ZshHistoryProvider::locateFile(const ShellEnvironment& environment) {
    auto fromEnvironment = historyFileFromEnvironment(environment);
    if (!fromEnvironment.empty()) {
        return fromEnvironment;
    }
    auto home = environment.getHomeDirectory();
    for (const char* name : {".zsh_history", ".zhistory", ".history"}) {
        std::error_code ec;
        if (fs::exists(home / name, ec)) {
            return home / name;
        }
    }
    return home / ".zsh_history";
}

FishHistoryProvider::FishHistoryProvider(fs::path file, Logger& logger)
    : FileHistoryProvider("fish", std::move(file), logger)
{
}

std::vector<HistoryEntry> FishHistoryProvider::parse(std::string_view content) {
    std::vector<HistoryEntry> entries;
    std::optional<HistoryEntry> current;
    std::vector<std::string> paths;
    bool inCommand = false;

    auto flush = [&]() {
        if (current && !isBlank(current->command)) {
            if (!paths.empty()) {
                current->cwd = paths.front();
                std::string joined;
                for (const auto& path : paths) {
                    if (!joined.empty()) {
                        joined.push_back('\n');
                    }
                    joined += path;
                }
                current->metadata["paths"] = std::move(joined);
            }
            entries.push_back(std::move(*current));
        }
        current.reset();
        paths.clear();
    };

    for (auto line : splitLines(content)) {
        if (line.substr(0, 7) == "- cmd: ") {
            flush();
            current = makeEntry(decodeFishText(line.substr(7)));
            inCommand = true;
            continue;
        }
        if (!current) {
            continue;
        }
        if (line.substr(0, 8) == "  when: ") {
            if (auto when = parseInteger(line.substr(8))) {
                current->timestamp = secondsToMilliseconds(*when);
            }
        } else if (line == "  paths:") {
            inCommand = false;
        } else if (line.substr(0, 6) == "    - ") {
            paths.push_back(decodeFishText(line.substr(6)));
        } else if (inCommand && line.substr(0, 2) == "  ") {
            current->command.push_back('\n');
            current->command += decodeFishText(line.substr(2));
        }
    }
    flush();
    return entries;
}

fs::path FishHistoryProvider::locateFile(const ShellEnvironment& environment) {
    fs::path dataHome;
    auto xdgDataHome = environment.get("XDG_DATA_HOME");
    if (xdgDataHome && !xdgDataHome->empty()) {
        dataHome = *xdgDataHome;
    } else {
        dataHome = environment.getHomeDirectory() / ".local" / "share";
    }
    std::string session = environment.getOr("fish_history", "fish");
    if (session.empty()) {
        session = "fish";
    }
    fs::path sessionFile = dataHome / "fish" / (session + "_history");
    std::error_code ec;
    if (fs::exists(sessionFile, ec)) {
        return sessionFile;
    }
    return dataHome / "fish" / "fish_history";
}

} // namespace shellsense
