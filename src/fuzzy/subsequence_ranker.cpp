#include <shellsense/fuzzy/subsequence_ranker.h>
#include <shellsense/fuzzy/levenshtein_ranker.h>

#include <algorithm>

namespace shellsense {

namespace {

bool isWordBoundary(char c) {
    return c == ' ' || c == '_' || c == '-';
}

} // namespace

SubsequenceRanker::SubsequenceRanker(size_t typoTolerance)
    : typoTolerance(typoTolerance)
{
}

FuzzyMatch SubsequenceRanker::score(std::string_view query, std::string_view text) const {
    if (query.empty()) {
        return FuzzyMatch{1.0, {}};
    }
    if (text.empty()) {
        return {};
    }

    const std::string q = toLowerAscii(query);
    const std::string t = toLowerAscii(text);

    if (q == t) {
        return FuzzyMatch{1.0, {MatchSpan{0, t.size()}}};
    }
    if (t.compare(0, q.size(), q) == 0) {
        return FuzzyMatch{0.9, {MatchSpan{0, q.size()}}};
    }
    if (auto position = t.find(q); position != std::string::npos) {
        return FuzzyMatch{0.8, {MatchSpan{position, position + q.size()}}};
    }

    FuzzyMatch match;
    double total = 0.0;
    size_t queryIndex = 0;
    size_t run = 0;
    std::optional<size_t> spanStart;

    size_t textIndex = 0;
    for (; queryIndex < q.size() && textIndex < t.size(); ++textIndex) {
        if (q[queryIndex] == t[textIndex]) {
            if (!spanStart) {
                spanStart = textIndex;
            }
            ++queryIndex;
            ++run;
            total += 1.0 + 0.5 * static_cast<double>(run);
            if (textIndex == 0 || isWordBoundary(t[textIndex - 1])) {
                total += 2.0;
            }
        } else {
            if (spanStart) {
                match.spans.push_back(MatchSpan{*spanStart, textIndex});
                spanStart.reset();
            }
            run = 0;
        }
    }
    if (spanStart) {
        match.spans.push_back(MatchSpan{*spanStart, textIndex});
    }

    if (queryIndex < q.size()) {
        // Not a subsequence; allow a small typo for queries long enough to carry intent
        if (this->typoTolerance > 0 && q.size() >= 3) {
            size_t distance = optimalStringAlignmentDistance(q, t);
            if (distance <= this->typoTolerance) {
                double longest = static_cast<double>(std::max(q.size(), t.size()));
                return FuzzyMatch{0.5 * (1.0 - static_cast<double>(distance) / longest), {}};
            }
        }
        return {};
    }

    const double normalized = std::min(total / (static_cast<double>(q.size()) * 3.0), 1.0);
    const double lengthPenalty = 1.0 - 0.2 * static_cast<double>(t.size() - q.size()) / static_cast<double>(t.size());
    match.score = normalized * lengthPenalty;
    return match;
}

} // namespace shellsense
