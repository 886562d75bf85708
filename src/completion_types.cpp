#include <shellsense/completion_types.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace shellsense {

std::string_view categoryName(CompletionCategory category) {
    switch (category) {
        case CompletionCategory::Command: return "command";
        case CompletionCategory::File: return "file";
        case CompletionCategory::Directory: return "directory";
        case CompletionCategory::Option: return "option";
        case CompletionCategory::Argument: return "argument";
        case CompletionCategory::Variable: return "variable";
        case CompletionCategory::Hostname: return "hostname";
        case CompletionCategory::History: return "history";
        case CompletionCategory::Other: return "other";
    }
    return "other";
}

std::string_view slotName(CompletionSlot slot) {
    switch (slot) {
        case CompletionSlot::Command: return "command";
        case CompletionSlot::Argument: return "argument";
        case CompletionSlot::Option: return "option";
        case CompletionSlot::Path: return "path";
        case CompletionSlot::Variable: return "variable";
    }
    return "argument";
}

const std::string& CompletionContext::lastWord() const {
    static const std::string empty;
    if (this->previousWords.empty()) {
        return empty;
    }
    return this->previousWords.back();
}

CompletionCandidate makeCandidate(std::string text,
                                  std::string description,
                                  CompletionCategory category,
                                  int priority) {
    CompletionCandidate candidate;
    candidate.display = text;
    candidate.text = std::move(text);
    candidate.description = std::move(description);
    candidate.category = category;
    candidate.priority = priority;
    return candidate;
}

bool startsWith(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::string toLowerAscii(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void deduplicateByText(std::vector<CompletionCandidate>& candidates) {
    std::unordered_set<std::string> seen;
    std::vector<CompletionCandidate> unique;
    unique.reserve(candidates.size());
    for (auto& candidate : candidates) {
        if (seen.insert(candidate.text).second) {
            unique.push_back(std::move(candidate));
        }
    }
    candidates = std::move(unique);
}

} // namespace shellsense
