#pragma once

#include <shellsense/config.h>
#include <shellsense/fuzzy/fuzzy_ranker.h>
#include <shellsense/logger.h>
#include <shellsense/process_runner.h>
#include <memory>
#include <string_view>

namespace shellsense {

/**
 * Create a ranker by strategy name: "auto" (fzf with subsequence fallback),
 * "fzf", "subsequence" or "levenshtein". Unknown names log a warning and
 * behave like "auto".
 */
std::unique_ptr<FuzzyRanker> makeFuzzyRanker(const FuzzyConfig& config,
                                             std::string_view strategy,
                                             ProcessRunner& runner,
                                             Logger& logger);

} // namespace shellsense
