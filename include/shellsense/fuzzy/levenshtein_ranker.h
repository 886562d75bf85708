#pragma once

#include <shellsense/fuzzy/fuzzy_ranker.h>

namespace shellsense {

size_t levenshteinDistance(std::string_view a, std::string_view b);

/**
 * Levenshtein distance that also counts a swap of two adjacent characters as one edit
 */
size_t optimalStringAlignmentDistance(std::string_view a, std::string_view b);

/**
 * Edit-distance scorer: 1 - d / max(|query|, |text|), zero beyond maxDistance
 */
class LevenshteinRanker : public ScoringRanker {
public:
    explicit LevenshteinRanker(size_t maxDistance = 3);

    std::string_view name() const override { return "levenshtein"; }
    FuzzyMatch score(std::string_view query, std::string_view text) const override;

private:
    size_t maxDistance;
};

} // namespace shellsense
