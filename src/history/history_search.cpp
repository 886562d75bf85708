#include <shellsense/history/history_search.h>
#include <shellsense/history/history_json.h>
#include <shellsense/completion_types.h>

#include <algorithm>
#include <chrono>
#include <limits>
#include <map>
#include <set>
#include <fmt/core.h>

namespace shellsense {

namespace {

constexpr size_t topCommandCount = 10;
constexpr size_t topDirectoryCount = 5;

// Count descending, then name ascending
template <typename Item>
std::vector<Item> topItems(const std::map<std::string, size_t>& counts, size_t limit) {
    std::vector<Item> items;
    for (const auto& [name, count] : counts) {
        items.push_back(Item{name, count});
    }
    std::stable_sort(items.begin(), items.end(), [](const Item& a, const Item& b) {
        return a.count > b.count;
    });
    if (items.size() > limit) {
        items.resize(limit);
    }
    return items;
}

// Embedded newlines are written as backslash-newline continuations
std::string withContinuations(const std::string& command) {
    std::string result;
    for (char c : command) {
        if (c == '\n') {
            result += "\\\n";
        } else {
            result += c;
        }
    }
    return result;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            result += '\n';
        }
        result += lines[i];
    }
    return result;
}

} // namespace

int64_t currentEpochMilliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::optional<int64_t> secondsToMilliseconds(int64_t seconds) {
    constexpr int64_t limit = std::numeric_limits<int64_t>::max() / 1000;
    if (seconds > limit || seconds < -limit) {
        return std::nullopt;
    }
    return seconds * 1000;
}

std::vector<HistoryEntry> searchEntries(const std::vector<HistoryEntry>& entries,
                                        std::string_view query,
                                        const HistorySearchOptions& options) {
    std::vector<HistoryEntry> results;
    const std::string lowerQuery = toLowerAscii(query);
    std::set<std::string> seen;

    for (auto it = entries.rbegin(); it != entries.rend() && results.size() < options.limit; ++it) {
        if (options.deduplicate && seen.count(it->command) > 0) {
            continue;
        }
        if (!lowerQuery.empty() && toLowerAscii(it->command).find(lowerQuery) == std::string::npos) {
            continue;
        }
        if (options.deduplicate) {
            seen.insert(it->command);
        }
        results.push_back(*it);
    }
    return results;
}

std::vector<HistoryEntry> recentEntries(const std::vector<HistoryEntry>& entries, size_t limit) {
    std::vector<HistoryEntry> results;
    for (auto it = entries.rbegin(); it != entries.rend() && results.size() < limit; ++it) {
        results.push_back(*it);
    }
    return results;
}

std::vector<HistoryEntry> newestFirst(const std::vector<HistoryEntry>& entries) {
    return std::vector<HistoryEntry>(entries.rbegin(), entries.rend());
}

std::string firstWord(std::string_view command) {
    return std::string(command.substr(0, command.find(' ')));
}

HistoryStats computeStats(const std::vector<HistoryEntry>& entries) {
    HistoryStats stats;
    std::map<std::string, size_t> commands;
    std::map<std::string, size_t> directories;
    std::set<std::string> unique;
    int64_t totalDuration = 0;
    size_t withDuration = 0;

    for (const auto& entry : entries) {
        ++commands[firstWord(entry.command)];
        unique.insert(entry.command);
        if (entry.cwd && !entry.cwd->empty()) {
            ++directories[*entry.cwd];
        }
        if (entry.duration && *entry.duration != 0) {
            totalDuration += *entry.duration;
            ++withDuration;
        }
        if (entry.exitCode && *entry.exitCode != 0) {
            ++stats.failedCommands;
        }
    }

    stats.total = entries.size();
    stats.unique = unique.size();
    if (withDuration > 0) {
        stats.averageDuration = static_cast<double>(totalDuration) / static_cast<double>(withDuration);
    }
    stats.topCommands = topItems<CommandCount>(commands, topCommandCount);
    stats.topDirectories = topItems<DirectoryCount>(directories, topDirectoryCount);
    return stats;
}

std::optional<std::string> exportEntries(const std::vector<HistoryEntry>& entries, std::string_view format) {
    std::vector<std::string> lines;

    if (format == "json") {
        try {
            json document = json::array();
            for (const auto& entry : entries) {
                document.push_back(entry);
            }
            return dumpJson(document, 2);
        } catch (const json::exception&) {
            return std::nullopt;
        }
    }
    if (format == "plain") {
        for (const auto& entry : entries) {
            lines.push_back(entry.command);
        }
        return joinLines(lines);
    }
    if (format == "bash") {
        for (const auto& entry : entries) {
            lines.push_back(withContinuations(entry.command));
        }
        return joinLines(lines);
    }
    if (format == "zsh") {
        for (const auto& entry : entries) {
            if (entry.timestamp) {
                int64_t seconds = *entry.timestamp / 1000;
                int64_t durationSeconds = entry.duration ? *entry.duration / 1000 : 0;
                lines.push_back(fmt::format(": {}:{};{}", seconds, durationSeconds, withContinuations(entry.command)));
            } else {
                lines.push_back(withContinuations(entry.command));
            }
        }
        return joinLines(lines);
    }
    return std::nullopt;
}

} // namespace shellsense
