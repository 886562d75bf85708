#include <shellsense/fuzzy/levenshtein_ranker.h>

#include <algorithm>
#include <vector>

namespace shellsense {

size_t levenshteinDistance(std::string_view a, std::string_view b) {
    std::vector<size_t> previous(b.size() + 1);
    std::vector<size_t> current(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) {
        previous[j] = j;
    }

    for (size_t i = 1; i <= a.size(); ++i) {
        current[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                current[j] = previous[j - 1];
            } else {
                current[j] = 1 + std::min({previous[j], current[j - 1], previous[j - 1]});
            }
        }
        std::swap(previous, current);
    }
    return previous[b.size()];
}

size_t optimalStringAlignmentDistance(std::string_view a, std::string_view b) {
    const size_t rows = a.size() + 1;
    const size_t columns = b.size() + 1;
    std::vector<size_t> d(rows * columns);
    auto at = [columns, &d](size_t i, size_t j) -> size_t& { return d[i * columns + j]; };

    for (size_t i = 0; i < rows; ++i) {
        at(i, 0) = i;
    }
    for (size_t j = 0; j < columns; ++j) {
        at(0, j) = j;
    }

    for (size_t i = 1; i < rows; ++i) {
        for (size_t j = 1; j < columns; ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            at(i, j) = std::min({at(i - 1, j) + 1, at(i, j - 1) + 1, at(i - 1, j - 1) + cost});
            if (i > 1 && j > 1 && a[i - 1] == b[j - 2] && a[i - 2] == b[j - 1]) {
                at(i, j) = std::min(at(i, j), at(i - 2, j - 2) + 1);
            }
        }
    }
    return at(a.size(), b.size());
}

LevenshteinRanker::LevenshteinRanker(size_t maxDistance)
    : maxDistance(maxDistance)
{
}

FuzzyMatch LevenshteinRanker::score(std::string_view query, std::string_view text) const {
    if (query.empty()) {
        return FuzzyMatch{1.0, {}};
    }

    const std::string q = toLowerAscii(query);
    const std::string t = toLowerAscii(text);
    size_t distance = levenshteinDistance(q, t);
    if (distance > this->maxDistance) {
        return {};
    }
    double longest = static_cast<double>(std::max(q.size(), t.size()));
    return FuzzyMatch{1.0 - static_cast<double>(distance) / longest, {}};
}

} // namespace shellsense
