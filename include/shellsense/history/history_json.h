#pragma once

#include <shellsense/history/history_entry.h>
#include <hv/json.hpp>

namespace shellsense {

using json = nlohmann::json;

/**
 * {"command", "timestamp", "exitCode", "cwd", "duration", "metadata"};
 * missing optionals are written as null
 */
void to_json(json& j, const HistoryEntry& entry);

/**
 * Accepts the short keys "cmd", "ts", "exit", "dir" and "dur" as well.
 * Throws json::exception if there is no string command.
 */
void from_json(const json& j, HistoryEntry& entry);

void to_json(json& j, const HistoryStats& stats);

/**
 * Serialize without throwing on invalid UTF-8: bad bytes become U+FFFD.
 * @param indent -1 for a single line
 */
std::string dumpJson(const json& value, int indent = -1);

/**
 * Integral JSON number that fits in int64_t, std::nullopt otherwise
 */
std::optional<int64_t> jsonToInt64(const json& value);

} // namespace shellsense
