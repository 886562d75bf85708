#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace shellsense {

enum class CompletionCategory {
    Command,
    File,
    Directory,
    Option,
    Argument,
    Variable,
    Hostname,
    History,
    Other
};

/**
 * Role of the word under the cursor
 */
enum class CompletionSlot {
    Command,
    Argument,
    Option,
    Path,
    Variable
};

std::string_view categoryName(CompletionCategory category);
std::string_view slotName(CompletionSlot slot);

/**
 * Half-open range [start, end) of matched characters inside a candidate text
 */
struct MatchSpan {
    size_t start = 0;
    size_t end = 0;

    bool operator==(const MatchSpan& other) const {
        return this->start == other.start && this->end == other.end;
    }
};

/**
 * One proposed completion.
 * `text` replaces the current word and is never empty for a returned candidate.
 */
struct CompletionCandidate {
    std::string text;
    std::string display;
    std::string description;
    CompletionCategory category = CompletionCategory::Other;
    int priority = 0;
    std::map<std::string, std::string> metadata;

    // Filled by the fuzzy ranking stage only
    double score = 0.0;
    std::vector<MatchSpan> matches;
};

/**
 * Classified view of a command line at the cursor.
 * Built once per request by classify() and not modified afterwards.
 */
struct CompletionContext {
    std::string line;
    size_t cursor = 0;
    std::string currentWord;
    std::vector<std::string> previousWords;
    std::string commandName;
    CompletionSlot slot = CompletionSlot::Command;
    std::string workingDirectory;

    /**
     * Index of the word being completed (0 for the command word)
     */
    size_t position() const { return this->previousWords.size(); }

    /**
     * Last complete word before the current one, empty if none
     */
    const std::string& lastWord() const;
};

/**
 * Build a candidate with display equal to text
 */
CompletionCandidate makeCandidate(std::string text,
                                  std::string description,
                                  CompletionCategory category,
                                  int priority);

bool startsWith(std::string_view text, std::string_view prefix);

/**
 * ASCII lowercase copy
 */
std::string toLowerAscii(std::string_view text);

/**
 * Remove candidates whose text was already seen, keeping the first occurrence
 */
void deduplicateByText(std::vector<CompletionCandidate>& candidates);

} // namespace shellsense
