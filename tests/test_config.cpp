#include <catch2/catch_test_macros.hpp>
#include <shellsense/config.h>
#include "TemporaryDirectory.h"

#include <algorithm>
#include <cstdio>

using namespace shellsense;
using namespace std::chrono_literals;

namespace {

bool hasWarning(const ConfigParseResult& result, const std::string& fragment) {
    return std::any_of(result.warnings.begin(), result.warnings.end(), [&](const std::string& warning) {
        return warning.find(fragment) != std::string::npos;
    });
}

} // namespace

TEST_CASE("Empty configuration keeps defaults", "[config]") {
    auto result = parseConfig("{}");
    REQUIRE(result.parsed);
    REQUIRE(result.warnings.empty());

    const Config& config = result.config;
    REQUIRE(config.completion.enabled);
    REQUIRE(config.completion.backend == "auto");
    REQUIRE(config.completion.maxSuggestions == 10);
    REQUIRE(config.completion.cacheTtl == 300000ms);
    REQUIRE(config.completion.commandTimeout == 500ms);
    REQUIRE(config.history.mode == "unified");
    REQUIRE(config.history.file.empty());
    REQUIRE(config.history.maxEntries == 10000);
    REQUIRE(config.history.searchLimit == 50);
    REQUIRE(config.fuzzy.fzfPath == "fzf");
    REQUIRE(config.logLevel == LogLevel::Warning);
    REQUIRE(config.shellPath.empty());
}

TEST_CASE("Full configuration document", "[config]") {
    auto result = parseConfig(R"({
        "shell": "/usr/bin/zsh",
        "log_level": "debug",
        "completion": {
            "enabled": false,
            "backend": "bash",
            "history_suggestions": false,
            "history_suggestion_limit": 5,
            "fuzzy_search": false,
            "fuzzy_backend": "levenshtein",
            "max_suggestions": 25,
            "cache_ttl": 1.5,
            "command_timeout_ms": 250
        },
        "fuzzy": {
            "fzf_path": "/opt/fzf/bin/fzf",
            "helper_timeout_ms": 2000,
            "max_distance": 4,
            "typo_tolerance": 2
        },
        "history": {
            "enabled": true,
            "mode": "shell",
            "file": "~/.local/share/shellsense/history.jsonl",
            "max_entries": 500,
            "save_corrections": false,
            "save_debounce_ms": 0,
            "search": {"max_results": 20, "deduplicate": false},
            "providers": {"bash": true, "zsh": false, "fish": false},
            "unknown_key": [1, 2, 3]
        }
    })");

    REQUIRE(result.parsed);
    REQUIRE(result.warnings.empty());

    const Config& config = result.config;
    REQUIRE(config.shellPath == "/usr/bin/zsh");
    REQUIRE(config.logLevel == LogLevel::Debug);

    REQUIRE_FALSE(config.completion.enabled);
    REQUIRE(config.completion.backend == "bash");
    REQUIRE_FALSE(config.completion.historySuggestions);
    REQUIRE(config.completion.historySuggestionLimit == 5);
    REQUIRE_FALSE(config.completion.fuzzySearch);
    REQUIRE(config.completion.fuzzyBackend == "levenshtein");
    REQUIRE(config.completion.maxSuggestions == 25);
    REQUIRE(config.completion.cacheTtl == 1500ms);
    REQUIRE(config.completion.commandTimeout == 250ms);

    REQUIRE(config.fuzzy.fzfPath == "/opt/fzf/bin/fzf");
    REQUIRE(config.fuzzy.helperTimeout == 2000ms);
    REQUIRE(config.fuzzy.maxDistance == 4);
    REQUIRE(config.fuzzy.typoTolerance == 2);

    REQUIRE(config.history.mode == "shell");
    REQUIRE(config.history.file == "~/.local/share/shellsense/history.jsonl");
    REQUIRE(config.history.maxEntries == 500);
    REQUIRE_FALSE(config.history.saveCorrections);
    REQUIRE(config.history.saveDebounce == 0ms);
    REQUIRE(config.history.searchLimit == 20);
    REQUIRE_FALSE(config.history.deduplicate);
    REQUIRE(config.history.providers.bash);
    REQUIRE_FALSE(config.history.providers.zsh);
    REQUIRE_FALSE(config.history.providers.fish);
}

TEST_CASE("Wrong types keep defaults and warn", "[config]") {
    auto result = parseConfig(R"({
        "completion": {"max_suggestions": "ten", "fuzzy_search": "yes", "cache_ttl": "soon"},
        "fuzzy": 3,
        "history": {"search": "all"}
    })");

    REQUIRE(result.parsed);
    REQUIRE(result.config.completion.maxSuggestions == 10);
    REQUIRE(result.config.completion.fuzzySearch);
    REQUIRE(result.config.completion.cacheTtl == 300000ms);
    REQUIRE(hasWarning(result, "completion.max_suggestions"));
    REQUIRE(hasWarning(result, "completion.fuzzy_search"));
    REQUIRE(hasWarning(result, "completion.cache_ttl"));
    REQUIRE(hasWarning(result, "fuzzy: expected an object"));
    REQUIRE(hasWarning(result, "history.search: expected an object"));
    REQUIRE(result.warnings.size() == 5);
}

TEST_CASE("Numbers out of range keep defaults and warn", "[config]") {
    auto result = parseConfig(R"({
        "completion": {"cache_ttl": 1e300, "max_suggestions": -1, "command_timeout_ms": 1e30},
        "history": {"max_entries": 2.5, "search": {"max_results": 20.0}}
    })");

    REQUIRE(result.parsed);
    REQUIRE(result.config.completion.cacheTtl == 300000ms);
    REQUIRE(result.config.completion.maxSuggestions == 10);
    REQUIRE(result.config.completion.commandTimeout == 500ms);
    REQUIRE(result.config.history.maxEntries == 10000);
    REQUIRE(result.config.history.searchLimit == 20);
    REQUIRE(hasWarning(result, "completion.cache_ttl"));
    REQUIRE(hasWarning(result, "completion.max_suggestions"));
    REQUIRE(hasWarning(result, "completion.command_timeout_ms"));
    REQUIRE(hasWarning(result, "history.max_entries"));
    REQUIRE(result.warnings.size() == 4);
}

TEST_CASE("Unknown log level warns", "[config]") {
    auto result = parseConfig(R"({"log_level": "chatty"})");
    REQUIRE(result.parsed);
    REQUIRE(result.config.logLevel == LogLevel::Warning);
    REQUIRE(hasWarning(result, "chatty"));
}

TEST_CASE("Documents that are not JSON objects", "[config]") {
    for (const char* text : {"", "{", "[1, 2]", "\"text\""}) {
        auto result = parseConfig(text);
        REQUIRE_FALSE(result.parsed);
        REQUIRE(result.warnings.size() == 1);
    }
}

TEST_CASE("Configuration files", "[config]") {
    TemporaryDirectory directory;

    SECTION("Readable file") {
        auto file = directory.writeFile("config.json", R"({"completion": {"max_suggestions": 3}})");
        auto result = loadConfigFile(file);
        REQUIRE(result.parsed);
        REQUIRE(result.config.completion.maxSuggestions == 3);
    }

    SECTION("Missing file") {
        auto result = loadConfigFile(directory.getPath() / "missing.json");
        REQUIRE_FALSE(result.parsed);
        REQUIRE(hasWarning(result, "missing.json"));
    }
}

TEST_CASE("Log levels", "[config][logger]") {
    REQUIRE(logLevelFromString("warn") == LogLevel::Warning);
    REQUIRE(logLevelFromString("off") == LogLevel::Quiet);
    REQUIRE_FALSE(logLevelFromString("verbose").has_value());
    REQUIRE(logLevelName(LogLevel::Info) == "info");

    std::FILE* stream = std::tmpfile();
    REQUIRE(stream != nullptr);
    {
        Logger logger(LogLevel::Info, stream);
        logger.debug("hidden {}", 1);
        logger.info("shown {}", 2);
        logger.error("failed: {}", "reason");
        REQUIRE_FALSE(logger.isEnabled(LogLevel::Quiet));
    }
    std::rewind(stream);
    std::string output;
    char buffer[256];
    while (std::fgets(buffer, sizeof(buffer), stream)) {
        output += buffer;
    }
    std::fclose(stream);
    REQUIRE(output == "[info] shown 2\n[error] failed: reason\n");
}
