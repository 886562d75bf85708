#include <shellsense/history/file_history_provider.h>
#include <shellsense/history/history_search.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace shellsense {

namespace fs = std::filesystem;

FileHistoryProvider::FileHistoryProvider(std::string providerName, fs::path file, Logger& logger)
    : providerName(std::move(providerName))
    , file(std::move(file))
    , logger(logger)
{
}

bool FileHistoryProvider::isAvailable() {
    std::error_code ec;
    if (!fs::is_regular_file(this->file, ec)) {
        return false;
    }
    std::ifstream stream(this->file);
    return stream.good();
}

void FileHistoryProvider::reloadIfChanged() {
    std::error_code ec;
    if (!fs::is_regular_file(this->file, ec)) {
        if (this->loadedSignature) {
            this->logger.debug("{}History: '{}' disappeared", this->providerName, this->file.string());
        }
        this->entries.clear();
        this->loadedSignature.reset();
        return;
    }

    FileSignature signature;
    signature.modified = fs::last_write_time(this->file, ec);
    if (!ec) {
        signature.size = fs::file_size(this->file, ec);
    }
    if (ec) {
        this->logger.debug("{}History: cannot stat '{}': {}", this->providerName, this->file.string(), ec.message());
        return;
    }
    if (this->loadedSignature && *this->loadedSignature == signature) {
        return;
    }

    std::ifstream stream(this->file, std::ios::binary);
    if (!stream) {
        this->logger.debug("{}History: cannot read '{}'", this->providerName, this->file.string());
        return;
    }
    std::stringstream buffer;
    buffer << stream.rdbuf();

    this->entries = this->parseContent(buffer.str());
    for (auto& entry : this->entries) {
        entry.source = this->providerName;
    }
    this->loadedSignature = signature;
    this->logger.debug("{}History: loaded {} entries from '{}'", this->providerName, this->entries.size(), this->file.string());
}

std::vector<HistoryEntry> FileHistoryProvider::search(std::string_view query, const HistorySearchOptions& options) {
    this->reloadIfChanged();
    return searchEntries(this->entries, query, options);
}

bool FileHistoryProvider::add(const HistoryEntry& /*entry*/) {
    return false;
}

std::vector<HistoryEntry> FileHistoryProvider::getRecent(size_t limit) {
    this->reloadIfChanged();
    return recentEntries(this->entries, limit);
}

std::vector<HistoryEntry> FileHistoryProvider::getAll() {
    this->reloadIfChanged();
    return newestFirst(this->entries);
}

HistoryStats FileHistoryProvider::getStats() {
    this->reloadIfChanged();
    return computeStats(this->entries);
}

void FileHistoryProvider::clear() {
    // The shell owns the file; forget the parsed copy until the file changes again
    this->reloadIfChanged();
    this->entries.clear();
}

} // namespace shellsense
