#include <shellsense/config.h>
#include <shellsense/history/history_json.h>

#include <cmath>
#include <fstream>
#include <sstream>
#include <type_traits>
#include <utility>

namespace shellsense {

namespace {

template <typename T>
void readField(const json& object, const char* key, T& target, const std::string& path, std::vector<std::string>& warnings) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return;
    }
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if (it->is_number()) {
            auto value = jsonToInt64(*it);
            if (!value || !std::in_range<T>(*value)) {
                warnings.push_back(fmt::format("{}.{}: {} is out of range", path, key, dumpJson(*it)));
                return;
            }
            target = static_cast<T>(*value);
            return;
        }
    }
    try {
        it->get_to(target);
    } catch (const json::exception& e) {
        warnings.push_back(fmt::format("{}.{}: {}", path, key, e.what()));
    }
}

void readSeconds(const json& object, const char* key, std::chrono::milliseconds& target, const std::string& path, std::vector<std::string>& warnings) {
    double seconds = 0;
    bool present = object.contains(key) && !object.at(key).is_null();
    if (!present) {
        return;
    }
    size_t before = warnings.size();
    readField(object, key, seconds, path, warnings);
    if (warnings.size() != before) {
        return;
    }
    double milliseconds = seconds * 1000.0;
    if (!std::isfinite(milliseconds) || milliseconds < 0.0 || milliseconds >= 9223372036854775808.0) {
        warnings.push_back(fmt::format("{}.{}: {} is out of range", path, key, seconds));
        return;
    }
    target = std::chrono::milliseconds(static_cast<long long>(milliseconds));
}

void readMilliseconds(const json& object, const char* key, std::chrono::milliseconds& target, const std::string& path, std::vector<std::string>& warnings) {
    long long value = target.count();
    size_t before = warnings.size();
    readField(object, key, value, path, warnings);
    if (warnings.size() == before) {
        target = std::chrono::milliseconds(value);
    }
}

const json* findObject(const json& parent, const char* key, const std::string& path, std::vector<std::string>& warnings) {
    auto it = parent.find(key);
    if (it == parent.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_object()) {
        warnings.push_back(fmt::format("{}.{}: expected an object", path, key));
        return nullptr;
    }
    return &*it;
}

void readCompletion(const json& j, CompletionConfig& config, std::vector<std::string>& warnings) {
    const std::string path = "completion";
    readField(j, "enabled", config.enabled, path, warnings);
    readField(j, "backend", config.backend, path, warnings);
    readField(j, "history_suggestions", config.historySuggestions, path, warnings);
    readField(j, "history_suggestion_limit", config.historySuggestionLimit, path, warnings);
    readField(j, "fuzzy_search", config.fuzzySearch, path, warnings);
    readField(j, "fuzzy_backend", config.fuzzyBackend, path, warnings);
    readField(j, "max_suggestions", config.maxSuggestions, path, warnings);
    readSeconds(j, "cache_ttl", config.cacheTtl, path, warnings);
    readMilliseconds(j, "command_timeout_ms", config.commandTimeout, path, warnings);
}

void readFuzzy(const json& j, FuzzyConfig& config, std::vector<std::string>& warnings) {
    const std::string path = "fuzzy";
    readField(j, "fzf_path", config.fzfPath, path, warnings);
    readMilliseconds(j, "helper_timeout_ms", config.helperTimeout, path, warnings);
    readField(j, "max_distance", config.maxDistance, path, warnings);
    readField(j, "typo_tolerance", config.typoTolerance, path, warnings);
}

void readHistory(const json& j, HistoryConfig& config, std::vector<std::string>& warnings) {
    const std::string path = "history";
    readField(j, "enabled", config.enabled, path, warnings);
    readField(j, "mode", config.mode, path, warnings);
    std::string file;
    readField(j, "file", file, path, warnings);
    if (!file.empty()) {
        config.file = file;
    }
    readField(j, "max_entries", config.maxEntries, path, warnings);
    readField(j, "save_corrections", config.saveCorrections, path, warnings);
    readMilliseconds(j, "save_debounce_ms", config.saveDebounce, path, warnings);

    if (const json* search = findObject(j, "search", path, warnings)) {
        readField(*search, "max_results", config.searchLimit, path + ".search", warnings);
        readField(*search, "deduplicate", config.deduplicate, path + ".search", warnings);
    }
    if (const json* providers = findObject(j, "providers", path, warnings)) {
        readField(*providers, "bash", config.providers.bash, path + ".providers", warnings);
        readField(*providers, "zsh", config.providers.zsh, path + ".providers", warnings);
        readField(*providers, "fish", config.providers.fish, path + ".providers", warnings);
    }
}

} // namespace

ConfigParseResult parseConfig(std::string_view jsonText) {
    ConfigParseResult result;

    json document = json::parse(jsonText.begin(), jsonText.end(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        result.warnings.push_back("configuration is not a JSON object");
        return result;
    }
    result.parsed = true;

    std::vector<std::string>& warnings = result.warnings;
    Config& config = result.config;

    if (const json* completion = findObject(document, "completion", "", warnings)) {
        readCompletion(*completion, config.completion, warnings);
    }
    if (const json* fuzzy = findObject(document, "fuzzy", "", warnings)) {
        readFuzzy(*fuzzy, config.fuzzy, warnings);
    }
    if (const json* history = findObject(document, "history", "", warnings)) {
        readHistory(*history, config.history, warnings);
    }

    std::string levelName;
    readField(document, "log_level", levelName, "", warnings);
    if (!levelName.empty()) {
        if (auto level = logLevelFromString(levelName)) {
            config.logLevel = *level;
        } else {
            warnings.push_back(fmt::format("log_level: unknown level '{}'", levelName));
        }
    }

    readField(document, "shell", config.shellPath, "", warnings);
    return result;
}

ConfigParseResult loadConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.warnings.push_back(fmt::format("cannot open configuration file '{}'", path.string()));
        return result;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseConfig(buffer.str());
}

} // namespace shellsense
