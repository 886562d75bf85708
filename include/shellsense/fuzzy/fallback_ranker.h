#pragma once

#include <shellsense/fuzzy/fuzzy_ranker.h>
#include <shellsense/logger.h>
#include <memory>

namespace shellsense {

/**
 * Uses the primary ranker while it is available and produces results,
 * the fallback otherwise
 */
class FallbackRanker : public FuzzyRanker {
public:
    FallbackRanker(std::unique_ptr<FuzzyRanker> primary, std::unique_ptr<FuzzyRanker> fallback, Logger& logger);

    std::string_view name() const override;
    bool isAvailable() override { return true; }
    std::optional<std::vector<RankedItem>> rank(std::string_view query, const std::vector<std::string>& texts) override;

private:
    std::unique_ptr<FuzzyRanker> primary;
    std::unique_ptr<FuzzyRanker> fallback;
    Logger& logger;
    bool primaryFailed = false;
};

} // namespace shellsense
