#include <shellsense/history/history_manager.h>
#include <shellsense/history/history_search.h>
#include <shellsense/history/owned_history_provider.h>
#include <shellsense/history/shell_history_providers.h>
#include <shellsense/filesystem/file_system_manager.h>

#include <algorithm>
#include <set>

namespace shellsense {

namespace {

void sortNewestFirst(std::vector<HistoryEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const HistoryEntry& a, const HistoryEntry& b) {
        if (a.timestamp && b.timestamp) {
            return *a.timestamp > *b.timestamp;
        }
        return a.timestamp.has_value() && !b.timestamp.has_value();
    });
}

std::unique_ptr<HistoryProvider> makeShellProvider(const HistoryProvidersConfig& providers,
                                                   const ShellEnvironment& environment,
                                                   ShellFamily family,
                                                   Logger& logger) {
    switch (family) {
        case ShellFamily::Generic:
        case ShellFamily::Bash:
            if (providers.bash) {
                return std::make_unique<BashHistoryProvider>(BashHistoryProvider::locateFile(environment), logger);
            }
            break;
        case ShellFamily::Zsh:
            if (providers.zsh) {
                return std::make_unique<ZshHistoryProvider>(ZshHistoryProvider::locateFile(environment), logger);
            }
            break;
        case ShellFamily::Fish:
            if (providers.fish) {
                return std::make_unique<FishHistoryProvider>(FishHistoryProvider::locateFile(environment), logger);
            }
            break;
    }
    return nullptr;
}

} // namespace

std::optional<HistoryMode> historyModeFromString(std::string_view name) {
    if (name == "solo" || name == "aish") {
        return HistoryMode::Solo;
    }
    if (name == "shell" || name == "shell-only") {
        return HistoryMode::ShellOnly;
    }
    if (name == "unified") {
        return HistoryMode::Unified;
    }
    return std::nullopt;
}

std::string_view historyModeName(HistoryMode mode) {
    switch (mode) {
        case HistoryMode::Solo: return "solo";
        case HistoryMode::ShellOnly: return "shell";
        case HistoryMode::Unified: return "unified";
    }
    return "solo";
}

HistoryManager::HistoryManager(HistoryMode mode,
                               std::unique_ptr<HistoryProvider> ownedProvider,
                               std::unique_ptr<HistoryProvider> shellProvider,
                               HistorySearchOptions defaultOptions,
                               Logger& logger)
    : mode(mode)
    , ownedProvider(std::move(ownedProvider))
    , shellProvider(std::move(shellProvider))
    , defaultOptions(defaultOptions)
    , logger(logger)
{
}

std::unique_ptr<HistoryManager> HistoryManager::create(const HistoryConfig& config,
                                                       const ShellEnvironment& environment,
                                                       ShellFamily family,
                                                       Logger& logger) {
    auto mode = historyModeFromString(config.mode);
    if (!mode) {
        logger.warn("HistoryManager: unknown history mode '{}', using solo", config.mode);
        mode = HistoryMode::Solo;
    }

    OwnedHistoryProvider::Options ownedOptions;
    ownedOptions.file = config.file;
    if (ownedOptions.file.empty()) {
        FileSystemManager fileSystemManager;
        if (!fileSystemManager.initialize()) {
            logger.warn("HistoryManager: cannot create data directory '{}'", fileSystemManager.getWritablePath().string());
        }
        ownedOptions.file = fileSystemManager.getDefaultHistoryPath();
    } else {
        ownedOptions.file = environment.expandTilde(config.file.string());
    }
    ownedOptions.maxEntries = config.maxEntries;
    ownedOptions.saveCorrections = config.saveCorrections;
    ownedOptions.debounce = config.saveDebounce;

    std::unique_ptr<HistoryProvider> shellProvider;
    if (*mode != HistoryMode::Solo) {
        shellProvider = makeShellProvider(config.providers, environment, family, logger);
    }

    logger.debug("HistoryManager: mode {}, owned store '{}', shell provider {}",
                 historyModeName(*mode), ownedOptions.file.string(),
                 shellProvider ? shellProvider->name() : std::string_view("none"));

    HistorySearchOptions defaults;
    defaults.limit = config.searchLimit;
    defaults.deduplicate = config.deduplicate;
    return std::make_unique<HistoryManager>(*mode,
                                            std::make_unique<OwnedHistoryProvider>(std::move(ownedOptions), logger),
                                            std::move(shellProvider),
                                            defaults,
                                            logger);
}

std::vector<HistoryProvider*> HistoryManager::activeProviders() {
    bool shellAvailable = this->shellProvider && this->shellProvider->isAvailable();
    switch (this->mode) {
        case HistoryMode::Solo:
            return {this->ownedProvider.get()};
        case HistoryMode::ShellOnly:
            if (shellAvailable) {
                return {this->shellProvider.get()};
            }
            this->logger.debug("HistoryManager: shell history unavailable, using owned store");
            return {this->ownedProvider.get()};
        case HistoryMode::Unified:
            if (shellAvailable) {
                return {this->ownedProvider.get(), this->shellProvider.get()};
            }
            return {this->ownedProvider.get()};
    }
    return {this->ownedProvider.get()};
}

std::vector<HistoryEntry> HistoryManager::mergeResults(const std::vector<std::vector<HistoryEntry>>& results,
                                                       size_t limit,
                                                       bool deduplicate) {
    std::vector<HistoryEntry> merged;
    for (const auto& result : results) {
        merged.insert(merged.end(), result.begin(), result.end());
    }
    sortNewestFirst(merged);

    std::vector<HistoryEntry> output;
    std::set<std::string> seen;
    for (auto& entry : merged) {
        if (output.size() >= limit) {
            break;
        }
        if (deduplicate && !seen.insert(entry.command).second) {
            continue;
        }
        output.push_back(std::move(entry));
    }
    return output;
}

std::vector<HistoryEntry> HistoryManager::search(std::string_view query) {
    return this->search(query, this->defaultOptions);
}

std::vector<HistoryEntry> HistoryManager::search(std::string_view query, const HistorySearchOptions& options) {
    std::vector<std::vector<HistoryEntry>> results;
    for (auto* provider : this->activeProviders()) {
        results.push_back(provider->search(query, options));
    }
    return mergeResults(results, options.limit, options.deduplicate);
}

bool HistoryManager::add(const HistoryEntry& entry) {
    return this->ownedProvider->add(entry);
}

std::vector<HistoryEntry> HistoryManager::getRecent(size_t limit) {
    auto providers = this->activeProviders();
    size_t perProvider = (limit + providers.size() - 1) / providers.size();
    std::vector<std::vector<HistoryEntry>> results;
    for (auto* provider : providers) {
        results.push_back(provider->getRecent(perProvider));
    }
    return mergeResults(results, limit, false);
}

std::map<std::string, HistoryStats> HistoryManager::getStats() {
    std::map<std::string, HistoryStats> stats;
    auto providers = this->activeProviders();
    std::vector<HistoryEntry> combined;
    for (auto* provider : providers) {
        stats[std::string(provider->name())] = provider->getStats();
        if (this->mode == HistoryMode::Unified) {
            auto all = provider->getAll();
            combined.insert(combined.end(), all.begin(), all.end());
        }
    }
    if (this->mode == HistoryMode::Unified) {
        stats["combined"] = computeStats(combined);
    }
    return stats;
}

void HistoryManager::clear() {
    this->ownedProvider->clear();
}

std::optional<std::string> HistoryManager::exportTo(std::string_view format) {
    std::vector<HistoryEntry> all;
    for (auto* provider : this->activeProviders()) {
        auto entries = provider->getAll();
        all.insert(all.end(), entries.begin(), entries.end());
    }
    sortNewestFirst(all);
    std::reverse(all.begin(), all.end());
    return exportEntries(all, format);
}

void HistoryManager::update() {
    this->ownedProvider->update();
}

bool HistoryManager::flush() {
    return this->ownedProvider->flush();
}

} // namespace shellsense
