#include <shellsense/completion/completion_manager.h>
#include <shellsense/command_line.h>
#include <shellsense/fuzzy/fuzzy_ranker_factory.h>
#include <shellsense/shell/shell_backend_factory.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <limits>
#include <fmt/chrono.h>
#include <fmt/core.h>

namespace shellsense {

namespace {

constexpr int historyPriorityBase = 100;

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

void sortByPriority(std::vector<CompletionCandidate>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(), [](const CompletionCandidate& a, const CompletionCandidate& b) {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        return a.text < b.text;
    });
}

} // namespace

CompletionManager::CompletionManager(CompletionConfig config,
                                     std::unique_ptr<ShellBackend> backend,
                                     std::unique_ptr<HistoryManager> history,
                                     std::unique_ptr<FuzzyRanker> ranker,
                                     Logger& logger,
                                     CompletionCache::Clock cacheClock,
                                     WallClock wallClock)
    : config(std::move(config))
    , backend(std::move(backend))
    , history(std::move(history))
    , ranker(std::move(ranker))
    , logger(logger)
    , cache(this->config.cacheTtl, std::move(cacheClock))
    , wallClock(std::move(wallClock))
{
}

std::unique_ptr<CompletionManager> CompletionManager::create(const Config& config,
                                                             const ShellEnvironment& environment,
                                                             ProcessRunner& runner,
                                                             Logger& logger) {
    std::string shellPath = config.shellPath.empty() ? environment.getShellPath() : config.shellPath;
    ShellFamily family = detectShellFamily(shellPath);
    logger.debug("CompletionManager: shell '{}' ({})", shellPath, shellFamilyName(family));

    BackendServices services{runner, environment, logger};
    services.commandTimeout = config.completion.commandTimeout;
    auto backend = makeShellBackend(config.completion.backend, family, services);

    std::unique_ptr<HistoryManager> history;
    if (config.history.enabled) {
        history = HistoryManager::create(config.history, environment, family, logger);
    }

    std::unique_ptr<FuzzyRanker> ranker;
    if (config.completion.fuzzySearch) {
        ranker = makeFuzzyRanker(config.fuzzy, config.completion.fuzzyBackend, runner, logger);
    }

    return std::make_unique<CompletionManager>(config.completion,
                                               std::move(backend),
                                               std::move(history),
                                               std::move(ranker),
                                               logger);
}

std::string CompletionManager::formatAge(int64_t timestamp, int64_t now) {
    constexpr int64_t minute = 60 * 1000;
    constexpr int64_t hour = 60 * minute;
    constexpr int64_t day = 24 * hour;
    constexpr int64_t week = 7 * day;

    int64_t age = 0;
    if (timestamp < now) {
        age = now >= 0 && timestamp < now - std::numeric_limits<int64_t>::max() ? std::numeric_limits<int64_t>::max() : now - timestamp;
    }
    if (age < hour) {
        return fmt::format("{}m ago", age / minute);
    }
    if (age < day) {
        return fmt::format("{}h ago", age / hour);
    }
    if (age < week) {
        return fmt::format("{}d ago", age / day);
    }
    std::time_t seconds = static_cast<std::time_t>(timestamp / 1000);
    try {
        return fmt::format("{:%Y-%m-%d}", fmt::localtime(seconds));
    } catch (const fmt::format_error&) {
        // Outside the calendar range of localtime
        return fmt::format("{}d ago", age / day);
    }
}

std::vector<CompletionCandidate> CompletionManager::historyCandidates(const CompletionContext& context) {
    std::vector<CompletionCandidate> candidates;
    if (!this->history || !this->config.historySuggestions || context.slot != CompletionSlot::Command) {
        return candidates;
    }

    HistorySearchOptions options;
    options.limit = this->config.historySuggestionLimit;
    options.deduplicate = true;
    auto entries = this->history->search(context.currentWord, options);

    int64_t now = this->wallClock();
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        std::string description = entry.timestamp
            ? "history - " + formatAge(*entry.timestamp, now)
            : "history";
        auto candidate = makeCandidate(entry.command,
                                       std::move(description),
                                       CompletionCategory::History,
                                       historyPriorityBase - static_cast<int>(i));
        if (!entry.source.empty()) {
            candidate.metadata["source"] = entry.source;
        }
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

std::vector<CompletionCandidate> CompletionManager::rank(const CompletionContext& context,
                                                         std::vector<CompletionCandidate> candidates) {
    if (this->config.fuzzySearch && this->ranker && !isBlank(context.currentWord)) {
        std::vector<std::string> texts;
        texts.reserve(candidates.size());
        for (const auto& candidate : candidates) {
            texts.push_back(candidate.text);
        }

        auto ranked = this->ranker->rank(context.currentWord, texts);
        if (ranked) {
            std::vector<CompletionCandidate> result;
            result.reserve(ranked->size());
            for (auto& item : *ranked) {
                CompletionCandidate candidate = candidates[item.index];
                candidate.score = item.match.score;
                candidate.matches = std::move(item.match.spans);
                result.push_back(std::move(candidate));
            }
            return result;
        }
        this->logger.debug("CompletionManager: ranker {} failed, sorting by priority", this->ranker->name());
    }

    sortByPriority(candidates);
    return candidates;
}

std::vector<CompletionCandidate> CompletionManager::getCompletions(const CompletionContext& context) {
    if (auto cached = this->cache.get(context)) {
        this->logger.debug("CompletionManager: cache hit for '{}'", context.currentWord);
        return *cached;
    }

    std::vector<CompletionCandidate> candidates;
    if (this->config.enabled && this->backend) {
        candidates = this->backend->resolve(context);
    }
    auto fromHistory = this->historyCandidates(context);
    candidates.insert(candidates.end(),
                      std::make_move_iterator(fromHistory.begin()),
                      std::make_move_iterator(fromHistory.end()));

    auto result = this->rank(context, std::move(candidates));
    if (this->config.maxSuggestions > 0 && result.size() > this->config.maxSuggestions) {
        result.resize(this->config.maxSuggestions);
    }

    this->logger.debug("CompletionManager: {} candidates for '{}' ({})",
                       result.size(), context.currentWord, slotName(context.slot));
    this->cache.put(context, result);
    return result;
}

std::vector<CompletionCandidate> CompletionManager::complete(std::string_view line, size_t cursor, const std::string& workingDirectory) {
    return this->getCompletions(classify(line, cursor, workingDirectory));
}

void CompletionManager::clearCache() {
    this->cache.clear();
}

} // namespace shellsense
