#pragma once

#include <shellsense/history/history_entry.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shellsense {

// Helpers over entry lists ordered oldest first, as they appear in a log file

std::vector<HistoryEntry> searchEntries(const std::vector<HistoryEntry>& entries,
                                        std::string_view query,
                                        const HistorySearchOptions& options);

/**
 * The newest `limit` entries, newest first, duplicates kept
 */
std::vector<HistoryEntry> recentEntries(const std::vector<HistoryEntry>& entries, size_t limit);

/**
 * All entries, newest first
 */
std::vector<HistoryEntry> newestFirst(const std::vector<HistoryEntry>& entries);

HistoryStats computeStats(const std::vector<HistoryEntry>& entries);

/**
 * First space-separated word of a command
 */
std::string firstWord(std::string_view command);

/**
 * Render entries as "json", "plain", "bash" or "zsh" (extended history).
 * Returns std::nullopt for any other format name or if the entries cannot
 * be serialized.
 */
std::optional<std::string> exportEntries(const std::vector<HistoryEntry>& entries, std::string_view format);

} // namespace shellsense
