#pragma once

#include <shellsense/fuzzy/fuzzy_ranker.h>
#include <shellsense/logger.h>
#include <shellsense/process_runner.h>
#include <chrono>
#include <optional>
#include <string>

namespace shellsense {

/**
 * Ranks through an external fzf in filter mode:
 *   fzf --filter <query> --no-sort --tiebreak=index -i
 *
 * Texts are streamed on stdin one per line (embedded newlines become spaces)
 * and fzf's output order is authoritative. Exit status 1 means no matches.
 * Any other failure marks the helper unavailable for the rest of the session.
 */
class FzfRanker : public FuzzyRanker {
public:
    FzfRanker(ProcessRunner& runner, Logger& logger, std::string fzfPath = "fzf",
              std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

    std::string_view name() const override { return "fzf"; }

    /**
     * Runs `fzf --version` on first use, then returns the cached answer
     */
    bool isAvailable() override;

    std::optional<std::vector<RankedItem>> rank(std::string_view query, const std::vector<std::string>& texts) override;

private:
    ProcessRunner& runner;
    Logger& logger;
    std::string fzfPath;
    std::chrono::milliseconds timeout;
    std::optional<bool> available;
};

} // namespace shellsense
