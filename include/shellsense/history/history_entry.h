#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shellsense {

/**
 * One command from a history log.
 * command is never empty; it may span several lines.
 */
struct HistoryEntry {
    std::string command;
    std::optional<int64_t> timestamp;   // epoch milliseconds
    std::optional<int> exitCode;
    std::optional<std::string> cwd;
    std::optional<int64_t> duration;    // milliseconds
    std::string source;                 // provider that produced the entry
    std::map<std::string, std::string> metadata;

    bool operator==(const HistoryEntry&) const = default;
};

struct HistorySearchOptions {
    size_t limit = 50;
    bool deduplicate = true;
};

struct CommandCount {
    std::string command;
    size_t count = 0;

    bool operator==(const CommandCount&) const = default;
};

struct DirectoryCount {
    std::string directory;
    size_t count = 0;

    bool operator==(const DirectoryCount&) const = default;
};

struct HistoryStats {
    size_t total = 0;
    size_t unique = 0;
    size_t failedCommands = 0;
    std::optional<double> averageDuration;      // over entries with a non-zero duration
    std::vector<CommandCount> topCommands;      // by first word, at most 10
    std::vector<DirectoryCount> topDirectories; // at most 5
};

int64_t currentEpochMilliseconds();

/**
 * Seconds from a log file as milliseconds; std::nullopt if the result
 * does not fit in int64_t
 */
std::optional<int64_t> secondsToMilliseconds(int64_t seconds);

} // namespace shellsense
