#pragma once

#include <shellsense/config.h>
#include <shellsense/history/history_provider.h>
#include <shellsense/logger.h>
#include <shellsense/shell_environment.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shellsense {

enum class HistoryMode {
    Solo,       // owned store only
    ShellOnly,  // the detected shell's log, owned store when it is unavailable
    Unified     // owned store plus the detected shell's log
};

/**
 * "solo", "aish", "shell", "shell-only" or "unified"
 */
std::optional<HistoryMode> historyModeFromString(std::string_view name);
std::string_view historyModeName(HistoryMode mode);

/**
 * Routes history queries to the providers selected by the mode and merges
 * their answers. Writes always go to the owned store.
 */
class HistoryManager {
public:
    HistoryManager(HistoryMode mode,
                   std::unique_ptr<HistoryProvider> ownedProvider,
                   std::unique_ptr<HistoryProvider> shellProvider,
                   HistorySearchOptions defaultOptions,
                   Logger& logger);

    /**
     * Build the owned store and the shell provider for the shell family.
     * An empty config.file uses the default data directory.
     */
    static std::unique_ptr<HistoryManager> create(const HistoryConfig& config,
                                                  const ShellEnvironment& environment,
                                                  ShellFamily family,
                                                  Logger& logger);

    // Disable copying
    HistoryManager(const HistoryManager&) = delete;
    HistoryManager& operator=(const HistoryManager&) = delete;

    std::vector<HistoryEntry> search(std::string_view query);
    std::vector<HistoryEntry> search(std::string_view query, const HistorySearchOptions& options);
    bool add(const HistoryEntry& entry);
    std::vector<HistoryEntry> getRecent(size_t limit);

    /**
     * Stats per active provider; in unified mode also "combined"
     */
    std::map<std::string, HistoryStats> getStats();

    /**
     * Clear the owned store. Shell logs are never modified.
     */
    void clear();

    /**
     * Entries of all active providers, oldest first, in an export format
     */
    std::optional<std::string> exportTo(std::string_view format);

    void update();
    bool flush();

    HistoryMode getMode() const { return this->mode; }
    HistoryProvider& getOwnedProvider() { return *this->ownedProvider; }
    HistoryProvider* getShellProvider() { return this->shellProvider.get(); }

    /**
     * Concatenate in provider order, stable sort newest first (entries
     * without a timestamp last), drop later copies of a command when
     * deduplicating, truncate to limit.
     */
    static std::vector<HistoryEntry> mergeResults(const std::vector<std::vector<HistoryEntry>>& results,
                                                  size_t limit,
                                                  bool deduplicate = true);

private:
    std::vector<HistoryProvider*> activeProviders();

    HistoryMode mode;
    std::unique_ptr<HistoryProvider> ownedProvider;
    std::unique_ptr<HistoryProvider> shellProvider;
    HistorySearchOptions defaultOptions;
    Logger& logger;
};

} // namespace shellsense
