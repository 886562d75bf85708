#pragma once

#include <shellsense/completion/completion_cache.h>
#include <shellsense/config.h>
#include <shellsense/fuzzy/fuzzy_ranker.h>
#include <shellsense/history/history_manager.h>
#include <shellsense/logger.h>
#include <shellsense/process_runner.h>
#include <shellsense/shell/shell_backend.h>
#include <shellsense/shell_environment.h>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace shellsense {

/**
 * Top-level completion engine.
 *
 * A request is classified, answered by the shell backend and (for the command
 * word) by history, ranked and cached. Results for the same word, command,
 * position and directory are served from the cache until the TTL runs out.
 */
class CompletionManager {
public:
    using WallClock = std::function<int64_t()>;

    /**
     * @param history may be null; history suggestions are skipped then
     * @param ranker may be null; candidates are sorted by priority then
     */
    CompletionManager(CompletionConfig config,
                      std::unique_ptr<ShellBackend> backend,
                      std::unique_ptr<HistoryManager> history,
                      std::unique_ptr<FuzzyRanker> ranker,
                      Logger& logger,
                      CompletionCache::Clock cacheClock = std::chrono::steady_clock::now,
                      WallClock wallClock = currentEpochMilliseconds);

    /**
     * Wire up backend, history and ranker from a configuration snapshot.
     * environment, runner and logger must outlive the manager.
     */
    static std::unique_ptr<CompletionManager> create(const Config& config,
                                                     const ShellEnvironment& environment,
                                                     ProcessRunner& runner,
                                                     Logger& logger);

    // Disable copying
    CompletionManager(const CompletionManager&) = delete;
    CompletionManager& operator=(const CompletionManager&) = delete;

    std::vector<CompletionCandidate> getCompletions(const CompletionContext& context);

    /**
     * Classify the line at the cursor and complete the word there
     */
    std::vector<CompletionCandidate> complete(std::string_view line, size_t cursor, const std::string& workingDirectory);

    void clearCache();

    ShellBackend* getBackend() { return this->backend.get(); }
    HistoryManager* getHistoryManager() { return this->history.get(); }
    FuzzyRanker* getRanker() { return this->ranker.get(); }
    const CompletionConfig& getConfig() const { return this->config; }

    /**
     * "5m ago", "3h ago", "2d ago", or the date for anything older than a week
     */
    static std::string formatAge(int64_t timestamp, int64_t now);

private:
    std::vector<CompletionCandidate> historyCandidates(const CompletionContext& context);
    std::vector<CompletionCandidate> rank(const CompletionContext& context, std::vector<CompletionCandidate> candidates);

    CompletionConfig config;
    std::unique_ptr<ShellBackend> backend;
    std::unique_ptr<HistoryManager> history;
    std::unique_ptr<FuzzyRanker> ranker;
    Logger& logger;
    CompletionCache cache;
    WallClock wallClock;
};

} // namespace shellsense
