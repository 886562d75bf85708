#pragma once

#include <shellsense/completion_types.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shellsense {

/**
 * Relevance of one text for a query.
 * score is in [0, 1]; 0 means the text does not match.
 */
struct FuzzyMatch {
    double score = 0.0;
    std::vector<MatchSpan> spans;

    bool isMatch() const { return this->score > 0.0; }
};

struct RankedItem {
    size_t index = 0;   // position in the ranked input
    FuzzyMatch match;
};

/**
 * Orders candidate texts by relevance to a query.
 *
 * rank() returns only matching items, best first. An empty query matches
 * everything with score 1.0 in input order. std::nullopt means the ranker
 * could not run at all (an external helper is missing or failed), which is
 * different from "nothing matched".
 */
class FuzzyRanker {
public:
    virtual ~FuzzyRanker() = default;

    virtual std::string_view name() const = 0;
    virtual bool isAvailable() = 0;
    virtual std::optional<std::vector<RankedItem>> rank(std::string_view query, const std::vector<std::string>& texts) = 0;
};

/**
 * Ranker built on a per-text scoring function.
 * Zero scores are dropped; equal scores keep their input order.
 */
class ScoringRanker : public FuzzyRanker {
public:
    bool isAvailable() override { return true; }
    std::optional<std::vector<RankedItem>> rank(std::string_view query, const std::vector<std::string>& texts) override;

    virtual FuzzyMatch score(std::string_view query, std::string_view text) const = 0;
};

} // namespace shellsense
