#include <shellsense/fuzzy/fuzzy_ranker_factory.h>
#include <shellsense/fuzzy/fallback_ranker.h>
#include <shellsense/fuzzy/fzf_ranker.h>
#include <shellsense/fuzzy/levenshtein_ranker.h>
#include <shellsense/fuzzy/subsequence_ranker.h>

namespace shellsense {

std::unique_ptr<FuzzyRanker> makeFuzzyRanker(const FuzzyConfig& config,
                                             std::string_view strategy,
                                             ProcessRunner& runner,
                                             Logger& logger) {
    if (strategy == "subsequence") {
        return std::make_unique<SubsequenceRanker>(config.typoTolerance);
    }
    if (strategy == "levenshtein") {
        return std::make_unique<LevenshteinRanker>(config.maxDistance);
    }

    if (strategy != "auto" && strategy != "fzf") {
        logger.warn("FuzzyRanker: unknown strategy '{}', using auto", strategy);
    }

    auto fzf = std::make_unique<FzfRanker>(runner, logger, config.fzfPath, config.helperTimeout);
    if (strategy == "fzf" && !fzf->isAvailable()) {
        logger.warn("FuzzyRanker: fzf requested but '{}' is not available, using subsequence", config.fzfPath);
    }
    return std::make_unique<FallbackRanker>(std::move(fzf),
                                            std::make_unique<SubsequenceRanker>(config.typoTolerance),
                                            logger);
}

} // namespace shellsense
