#include <shellsense/fuzzy/fallback_ranker.h>

namespace shellsense {

FallbackRanker::FallbackRanker(std::unique_ptr<FuzzyRanker> primary, std::unique_ptr<FuzzyRanker> fallback, Logger& logger)
    : primary(std::move(primary))
    , fallback(std::move(fallback))
    , logger(logger)
{
}

std::string_view FallbackRanker::name() const {
    return this->primaryFailed ? this->fallback->name() : this->primary->name();
}

std::optional<std::vector<RankedItem>> FallbackRanker::rank(std::string_view query, const std::vector<std::string>& texts) {
    if (!this->primaryFailed) {
        if (this->primary->isAvailable()) {
            if (auto ranked = this->primary->rank(query, texts)) {
                return ranked;
            }
        }
        this->primaryFailed = !this->primary->isAvailable();
        this->logger.debug("FallbackRanker: {} unavailable, using {}", this->primary->name(), this->fallback->name());
    }
    return this->fallback->rank(query, texts);
}

} // namespace shellsense
