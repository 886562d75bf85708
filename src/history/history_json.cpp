#include <shellsense/history/history_json.h>

#include <cmath>
#include <limits>

namespace shellsense {

namespace {

const json* findEither(const json& j, const char* key, const char* shortKey) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        return &*it;
    }
    if (auto it = j.find(shortKey); it != j.end() && !it->is_null()) {
        return &*it;
    }
    return nullptr;
}

std::optional<int64_t> readInteger(const json& j, const char* key, const char* shortKey) {
    const json* value = findEither(j, key, shortKey);
    if (!value) {
        return std::nullopt;
    }
    return jsonToInt64(*value);
}

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

void to_json(json& j, const HistoryEntry& entry) {
    j = json{
        {"command", entry.command},
        {"timestamp", optionalToJson(entry.timestamp)},
        {"exitCode", optionalToJson(entry.exitCode)},
        {"cwd", optionalToJson(entry.cwd)},
        {"duration", optionalToJson(entry.duration)},
        {"metadata", entry.metadata}
    };
}

void from_json(const json& j, HistoryEntry& entry) {
    entry = HistoryEntry{};
    j.at(j.contains("command") ? "command" : "cmd").get_to(entry.command);

    entry.timestamp = readInteger(j, "timestamp", "ts");
    entry.duration = readInteger(j, "duration", "dur");
    if (auto exitCode = readInteger(j, "exitCode", "exit");
        exitCode && *exitCode >= std::numeric_limits<int>::min() && *exitCode <= std::numeric_limits<int>::max()) {
        entry.exitCode = static_cast<int>(*exitCode);
    }
    if (const json* cwd = findEither(j, "cwd", "dir"); cwd && cwd->is_string()) {
        entry.cwd = cwd->get<std::string>();
    }

    if (auto metadata = j.find("metadata"); metadata != j.end() && metadata->is_object()) {
        for (auto item = metadata->begin(); item != metadata->end(); ++item) {
            entry.metadata[item.key()] = item.value().is_string() ? item.value().get<std::string>() : dumpJson(item.value());
        }
    }
}

void to_json(json& j, const HistoryStats& stats) {
    json topCommands = json::array();
    for (const auto& item : stats.topCommands) {
        topCommands.push_back(json{{"command", item.command}, {"count", item.count}});
    }
    json topDirectories = json::array();
    for (const auto& item : stats.topDirectories) {
        topDirectories.push_back(json{{"directory", item.directory}, {"count", item.count}});
    }
    j = json{
        {"total", stats.total},
        {"unique", stats.unique},
        {"failedCommands", stats.failedCommands},
        {"averageDuration", optionalToJson(stats.averageDuration)},
        {"topCommands", std::move(topCommands)},
        {"topDirectories", std::move(topDirectories)}
    };
}

std::string dumpJson(const json& value, int indent) {
    return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::optional<int64_t> jsonToInt64(const json& value) {
    if (value.is_number_unsigned()) {
        auto number = value.get<uint64_t>();
        if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(number);
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        // Range of int64_t is [-2^63, 2^63)
        double number = value.get<double>();
        constexpr double limit = 9223372036854775808.0;
        if (!std::isfinite(number) || std::trunc(number) != number || number < -limit || number >= limit) {
            return std::nullopt;
        }
        return static_cast<int64_t>(number);
    }
    return std::nullopt;
}

} // namespace shellsense
