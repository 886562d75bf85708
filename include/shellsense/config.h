#pragma once

#include <shellsense/logger.h>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace shellsense {

struct CompletionConfig {
    bool enabled = true;
    std::string backend = "auto";          // auto | generic | bash | zsh
    bool historySuggestions = true;
    size_t historySuggestionLimit = 20;
    bool fuzzySearch = true;
    std::string fuzzyBackend = "auto";     // auto | fzf | subsequence | levenshtein
    size_t maxSuggestions = 10;            // 0 = unlimited
    std::chrono::milliseconds cacheTtl{300000};
    std::chrono::milliseconds commandTimeout{500};
};

struct FuzzyConfig {
    std::string fzfPath = "fzf";
    std::chrono::milliseconds helperTimeout{1000};
    size_t maxDistance = 3;
    size_t typoTolerance = 1;
};

struct HistoryProvidersConfig {
    bool bash = true;
    bool zsh = true;
    bool fish = true;
};

struct HistoryConfig {
    bool enabled = true;
    std::string mode = "unified";          // solo | shell | unified
    std::filesystem::path file;            // empty = default data directory
    size_t maxEntries = 10000;
    bool saveCorrections = true;
    size_t searchLimit = 50;
    bool deduplicate = true;
    std::chrono::milliseconds saveDebounce{1000};
    HistoryProvidersConfig providers;
};

/**
 * Static configuration snapshot handed to the engine at startup
 */
struct Config {
    CompletionConfig completion;
    HistoryConfig history;
    FuzzyConfig fuzzy;
    LogLevel logLevel = LogLevel::Warning;
    std::string shellPath;                 // empty = $SHELL from the environment snapshot
};

struct ConfigParseResult {
    Config config;
    std::vector<std::string> warnings;
    bool parsed = false;                   // false if the document itself was not valid JSON
};

/**
 * Build a Config from a JSON document.
 * Missing keys keep their defaults; keys with the wrong type keep their
 * defaults and add a warning. Unknown keys are ignored.
 */
ConfigParseResult parseConfig(std::string_view jsonText);

/**
 * Read and parse a JSON configuration file
 */
ConfigParseResult loadConfigFile(const std::filesystem::path& path);

} // namespace shellsense
