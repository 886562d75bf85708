#pragma once

#include <shellsense/fuzzy/fuzzy_ranker.h>

namespace shellsense {

/**
 * Built-in case-insensitive scorer.
 *
 * Exact match 1.0, prefix 0.9, substring 0.8. Otherwise the query must be an
 * in-order subsequence of the text: consecutive runs and word-boundary hits
 * (start of text or after ' ', '_', '-') score higher, and longer texts are
 * penalised. When the subsequence test fails, queries of three or more
 * characters within typoTolerance transpositions/edits of the text still get a
 * low score so that "gti" finds "git".
 */
class SubsequenceRanker : public ScoringRanker {
public:
    explicit SubsequenceRanker(size_t typoTolerance = 1);

    std::string_view name() const override { return "subsequence"; }
    FuzzyMatch score(std::string_view query, std::string_view text) const override;

private:
    size_t typoTolerance;
};

} // namespace shellsense
