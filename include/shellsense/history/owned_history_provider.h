#pragma once

#include <shellsense/history/history_provider.h>
#include <shellsense/logger.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace shellsense {

/**
 * History store written by shellsense itself: one JSON object per line.
 *
 * add() changes memory immediately and marks the store dirty; the file is
 * written by update() once the debounce window since the last change has
 * passed, by flush(), or by the destructor. New entries are appended; after a
 * trim, an import or a clear the whole file is rewritten through a temporary
 * file and a rename.
 */
class OwnedHistoryProvider : public HistoryProvider {
public:
    using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;
    using WallClock = std::function<int64_t()>;

    struct Options {
        std::filesystem::path file;
        size_t maxEntries = 10000;
        bool saveCorrections = true;
        std::chrono::milliseconds debounce{1000};
    };

    OwnedHistoryProvider(Options options,
                         Logger& logger,
                         SteadyClock steadyClock = std::chrono::steady_clock::now,
                         WallClock wallClock = currentEpochMilliseconds);
    ~OwnedHistoryProvider() override;

    // Disable copying
    OwnedHistoryProvider(const OwnedHistoryProvider&) = delete;
    OwnedHistoryProvider& operator=(const OwnedHistoryProvider&) = delete;

    std::string_view name() const override { return "shellsense"; }
    bool isAvailable() override;
    std::vector<HistoryEntry> search(std::string_view query, const HistorySearchOptions& options) override;
    bool add(const HistoryEntry& entry) override;
    std::vector<HistoryEntry> getRecent(size_t limit) override;
    std::vector<HistoryEntry> getAll() override;
    HistoryStats getStats() override;
    void clear() override;
    void update() override;
    bool flush() override;

    /**
     * Copy up to maxImport of the newest entries of another provider.
     * @return number of entries imported
     */
    size_t importFrom(HistoryProvider& provider, bool deduplicate = true, size_t maxImport = 1000);

    /**
     * Render the store in "json", "plain", "bash" or "zsh" format
     */
    std::optional<std::string> exportTo(std::string_view format) const;

    bool isDirty() const { return this->dirty; }
    size_t size() const { return this->entries.size(); }
    const std::filesystem::path& getFile() const { return this->options.file; }

    /**
     * Parse one line of the store. A JSON object with a command becomes a full
     * entry; any other non-blank line is a bare legacy entry.
     */
    static std::optional<HistoryEntry> parseLine(std::string_view line);
    static std::string formatEntry(const HistoryEntry& entry);

private:
    void load();
    bool trimToLimit();
    void markChanged();
    bool persist();
    bool appendPending();
    bool rewriteFile();

    Options options;
    Logger& logger;
    SteadyClock steadyClock;
    WallClock wallClock;

    std::vector<HistoryEntry> entries;          // oldest first
    std::vector<HistoryEntry> pendingAppends;
    bool needsRewrite = false;
    bool dirty = false;
    std::chrono::steady_clock::time_point lastChange;
};

} // namespace shellsense
