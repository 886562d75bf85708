#pragma once

#include <shellsense/completion_types.h>
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace shellsense {

/**
 * Ranked results keyed by (current word, command, word position, working
 * directory). Entries expire after the TTL and are dropped when read.
 */
class CompletionCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Key = std::tuple<std::string, std::string, size_t, std::string>;

    explicit CompletionCache(std::chrono::milliseconds ttl, Clock clock = std::chrono::steady_clock::now);

    static Key makeKey(const CompletionContext& context);

    std::optional<std::vector<CompletionCandidate>> get(const CompletionContext& context);

    /**
     * Store results, replacing anything cached under the same key
     */
    void put(const CompletionContext& context, std::vector<CompletionCandidate> candidates);

    void clear() { this->entries.clear(); }
    size_t size() const { return this->entries.size(); }

private:
    struct Entry {
        std::vector<CompletionCandidate> candidates;
        std::chrono::steady_clock::time_point insertedAt;
    };

    std::chrono::milliseconds ttl;
    Clock clock;
    std::map<Key, Entry> entries;
};

} // namespace shellsense
