#include <shellsense/completion/completion_cache.h>

namespace shellsense {

CompletionCache::CompletionCache(std::chrono::milliseconds ttl, Clock clock)
    : ttl(ttl)
    , clock(std::move(clock))
{
}

CompletionCache::Key CompletionCache::makeKey(const CompletionContext& context) {
    return Key{context.currentWord, context.commandName, context.position(), context.workingDirectory};
}

std::optional<std::vector<CompletionCandidate>> CompletionCache::get(const CompletionContext& context) {
    auto it = this->entries.find(makeKey(context));
    if (it == this->entries.end()) {
        return std::nullopt;
    }
    if (this->clock() - it->second.insertedAt >= this->ttl) {
        this->entries.erase(it);
        return std::nullopt;
    }
    return it->second.candidates;
}

void CompletionCache::put(const CompletionContext& context, std::vector<CompletionCandidate> candidates) {
    this->entries[makeKey(context)] = Entry{std::move(candidates), this->clock()};
}

} // namespace shellsense
