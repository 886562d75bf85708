#include <shellsense/fuzzy/fuzzy_ranker.h>

#include <algorithm>

namespace shellsense {

std::optional<std::vector<RankedItem>> ScoringRanker::rank(std::string_view query, const std::vector<std::string>& texts) {
    std::vector<RankedItem> ranked;
    ranked.reserve(texts.size());

    if (query.empty()) {
        for (size_t i = 0; i < texts.size(); ++i) {
            ranked.push_back(RankedItem{i, FuzzyMatch{1.0, {}}});
        }
        return ranked;
    }

    for (size_t i = 0; i < texts.size(); ++i) {
        FuzzyMatch match = this->score(query, texts[i]);
        if (match.isMatch()) {
            ranked.push_back(RankedItem{i, std::move(match)});
        }
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedItem& a, const RankedItem& b) {
        return a.match.score > b.match.score;
    });
    return ranked;
}

} // namespace shellsense
