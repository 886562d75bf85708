#pragma once

#include <shellsense/history/history_entry.h>
#include <string_view>
#include <vector>

namespace shellsense {

/**
 * Source of history entries backed by one on-disk log format.
 *
 * Result lists are ordered newest first. Providers never throw; an unreadable
 * backing file behaves like an empty one.
 */
class HistoryProvider {
public:
    virtual ~HistoryProvider() = default;

    virtual std::string_view name() const = 0;

    /**
     * True if the backing store exists and can be read
     */
    virtual bool isAvailable() = 0;

    /**
     * Case-insensitive substring search, newest to oldest.
     * An empty query returns the newest entries.
     */
    virtual std::vector<HistoryEntry> search(std::string_view query, const HistorySearchOptions& options) = 0;

    /**
     * Append an entry. Read-only providers ignore it and return false.
     */
    virtual bool add(const HistoryEntry& entry) = 0;

    virtual std::vector<HistoryEntry> getRecent(size_t limit) = 0;
    virtual std::vector<HistoryEntry> getAll() = 0;
    virtual HistoryStats getStats() = 0;

    /**
     * Drop all entries. Shell-native providers only forget their in-memory copy.
     */
    virtual void clear() = 0;

    /**
     * Periodic tick from the host, used for deferred writes
     */
    virtual void update() {}

    /**
     * Write pending changes now
     * @return false if pending changes could not be written
     */
    virtual bool flush() { return true; }
};

} // namespace shellsense
