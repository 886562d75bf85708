#include <shellsense/history/owned_history_provider.h>
#include <shellsense/history/history_json.h>
#include <shellsense/history/history_search.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <set>
#include <system_error>

namespace shellsense {

namespace fs = std::filesystem;

namespace {

constexpr const char* sourceName = "shellsense";

std::string_view trimmed(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool isCorrection(const HistoryEntry& entry) {
    auto it = entry.metadata.find("isCorrection");
    return it != entry.metadata.end() && it->second == "true";
}

bool endsWithNewline(const fs::path& file) {
    std::ifstream stream(file, std::ios::binary | std::ios::ate);
    if (!stream || stream.tellg() <= 0) {
        return true;
    }
    stream.seekg(-1, std::ios::end);
    char last = 0;
    stream.get(last);
    return last == '\n';
}

} // namespace

OwnedHistoryProvider::OwnedHistoryProvider(Options options, Logger& logger, SteadyClock steadyClock, WallClock wallClock)
    : options(std::move(options))
    , logger(logger)
    , steadyClock(std::move(steadyClock))
    , wallClock(std::move(wallClock))
{
    this->load();
}

OwnedHistoryProvider::~OwnedHistoryProvider() {
    this->flush();
}

std::optional<HistoryEntry> OwnedHistoryProvider::parseLine(std::string_view line) {
    std::string_view text = trimmed(line);
    if (text.empty()) {
        return std::nullopt;
    }

    HistoryEntry entry;
    bool structured = false;
    if (text.front() == '{') {
        json document = json::parse(text.begin(), text.end(), nullptr, false);
        if (!document.is_discarded() && document.is_object()) {
            auto command = document.find(document.contains("command") ? "command" : "cmd");
            if (command != document.end() && command->is_string()) {
                try {
                    entry = document.get<HistoryEntry>();
                    structured = true;
                } catch (const json::exception&) {
                    structured = false;
                }
            }
        }
    }
    if (!structured) {
        entry = HistoryEntry{};
        entry.command = std::string(text);
    }
    if (trimmed(entry.command).empty()) {
        return std::nullopt;
    }
    entry.source = sourceName;
    return entry;
}

std::string OwnedHistoryProvider::formatEntry(const HistoryEntry& entry) {
    return dumpJson(json(entry));
}

void OwnedHistoryProvider::load() {
    this->entries.clear();
    std::error_code ec;
    if (!fs::is_regular_file(this->options.file, ec)) {
        return;
    }
    std::ifstream stream(this->options.file, std::ios::binary);
    if (!stream) {
        this->logger.debug("OwnedHistory: cannot read '{}'", this->options.file.string());
        return;
    }
    std::string line;
    while (std::getline(stream, line)) {
        if (auto entry = parseLine(line)) {
            this->entries.push_back(std::move(*entry));
        }
    }
    if (this->trimToLimit()) {
        this->needsRewrite = true;
    }
    this->logger.debug("OwnedHistory: loaded {} entries from '{}'", this->entries.size(), this->options.file.string());
}

bool OwnedHistoryProvider::trimToLimit() {
    if (this->options.maxEntries == 0 || this->entries.size() <= this->options.maxEntries) {
        return false;
    }
    size_t excess = this->entries.size() - this->options.maxEntries;
    this->entries.erase(this->entries.begin(), this->entries.begin() + static_cast<std::ptrdiff_t>(excess));
    return true;
}

bool OwnedHistoryProvider::isAvailable() {
    // A missing file is created on the first write
    std::error_code ec;
    if (!fs::exists(this->options.file, ec)) {
        return !ec;
    }
    return fs::is_regular_file(this->options.file, ec);
}

std::vector<HistoryEntry> OwnedHistoryProvider::search(std::string_view query, const HistorySearchOptions& options) {
    return searchEntries(this->entries, query, options);
}

bool OwnedHistoryProvider::add(const HistoryEntry& entry) {
    if (trimmed(entry.command).empty()) {
        return false;
    }
    if (!this->options.saveCorrections && isCorrection(entry)) {
        this->logger.debug("OwnedHistory: skipping correction '{}'", entry.command);
        return false;
    }
    if (!this->entries.empty() && this->entries.back().command == entry.command) {
        return false;
    }

    HistoryEntry stored = entry;
    if (!stored.timestamp) {
        stored.timestamp = this->wallClock();
    }
    stored.source = sourceName;

    this->entries.push_back(stored);
    this->pendingAppends.push_back(std::move(stored));
    if (this->trimToLimit()) {
        this->needsRewrite = true;
    }
    this->markChanged();
    return true;
}

std::vector<HistoryEntry> OwnedHistoryProvider::getRecent(size_t limit) {
    return recentEntries(this->entries, limit);
}

std::vector<HistoryEntry> OwnedHistoryProvider::getAll() {
    return newestFirst(this->entries);
}

HistoryStats OwnedHistoryProvider::getStats() {
    return computeStats(this->entries);
}

void OwnedHistoryProvider::clear() {
    this->entries.clear();
    this->pendingAppends.clear();
    this->needsRewrite = true;
    this->markChanged();
    this->persist();
}

void OwnedHistoryProvider::markChanged() {
    this->dirty = true;
    this->lastChange = this->steadyClock();
}

void OwnedHistoryProvider::update() {
    if (!this->dirty) {
        return;
    }
    if (this->steadyClock() - this->lastChange < this->options.debounce) {
        return;
    }
    this->persist();
}

bool OwnedHistoryProvider::flush() {
    if (!this->dirty) {
        return true;
    }
    return this->persist();
}

bool OwnedHistoryProvider::persist() {
    auto parent = this->options.file.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            this->logger.warn("OwnedHistory: cannot create '{}': {}", parent.string(), ec.message());
            return false;
        }
    }

    bool written = false;
    try {
        written = this->needsRewrite ? this->rewriteFile() : this->appendPending();
    } catch (const json::exception& e) {
        this->logger.warn("OwnedHistory: cannot serialize history: {}", e.what());
    }
    if (!written) {
        // Stay dirty so the next tick retries
        this->lastChange = this->steadyClock();
        return false;
    }
    this->pendingAppends.clear();
    this->needsRewrite = false;
    this->dirty = false;
    return true;
}

bool OwnedHistoryProvider::appendPending() {
    if (this->pendingAppends.empty()) {
        return true;
    }
    bool needsSeparator = !endsWithNewline(this->options.file);
    std::ofstream stream(this->options.file, std::ios::binary | std::ios::app);
    if (!stream) {
        this->logger.warn("OwnedHistory: cannot open '{}' for writing", this->options.file.string());
        return false;
    }
    if (needsSeparator) {
        stream << '\n';
    }
    for (const auto& entry : this->pendingAppends) {
        stream << formatEntry(entry) << '\n';
    }
    stream.flush();
    if (!stream) {
        this->logger.warn("OwnedHistory: failed to append to '{}'", this->options.file.string());
        return false;
    }
    return true;
}

bool OwnedHistoryProvider::rewriteFile() {
    fs::path temporary = this->options.file;
    temporary += ".tmp";
    {
        std::ofstream stream(temporary, std::ios::binary | std::ios::trunc);
        if (!stream) {
            this->logger.warn("OwnedHistory: cannot open '{}' for writing", temporary.string());
            return false;
        }
        for (const auto& entry : this->entries) {
            stream << formatEntry(entry) << '\n';
        }
        stream.flush();
        if (!stream) {
            this->logger.warn("OwnedHistory: failed to write '{}'", temporary.string());
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temporary, this->options.file, ec);
    if (ec) {
        this->logger.warn("OwnedHistory: cannot replace '{}': {}", this->options.file.string(), ec.message());
        fs::remove(temporary, ec);
        return false;
    }
    return true;
}

size_t OwnedHistoryProvider::importFrom(HistoryProvider& provider, bool deduplicate, size_t maxImport) {
    auto incoming = provider.getAll();
    if (incoming.size() > maxImport) {
        incoming.resize(maxImport);
    }
    std::reverse(incoming.begin(), incoming.end());

    std::set<std::string> known;
    if (deduplicate) {
        for (const auto& entry : this->entries) {
            known.insert(entry.command);
        }
    }

    size_t imported = 0;
    for (auto& entry : incoming) {
        if (deduplicate && !known.insert(entry.command).second) {
            continue;
        }
        entry.metadata["importedFrom"] = std::string(provider.name());
        entry.source = sourceName;
        this->entries.push_back(std::move(entry));
        ++imported;
    }
    if (imported == 0) {
        return 0;
    }

    // Entries without a timestamp count as the oldest
    constexpr int64_t oldest = std::numeric_limits<int64_t>::min();
    std::stable_sort(this->entries.begin(), this->entries.end(), [oldest](const HistoryEntry& a, const HistoryEntry& b) {
        return a.timestamp.value_or(oldest) < b.timestamp.value_or(oldest);
    });
    this->trimToLimit();
    this->needsRewrite = true;
    this->markChanged();
    this->logger.info("OwnedHistory: imported {} entries from {}", imported, provider.name());
    return imported;
}

std::optional<std::string> OwnedHistoryProvider::exportTo(std::string_view format) const {
    return exportEntries(this->entries, format);
}

} // namespace shellsense
