#pragma once

#include <shellsense/history/history_provider.h>
#include <shellsense/logger.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace shellsense {

/**
 * Read-only mirror of a history file written by a shell.
 * The file is parsed again whenever its size or modification time changes,
 * so commands from the running shell show up in searches.
 */
class FileHistoryProvider : public HistoryProvider {
public:
    FileHistoryProvider(std::string providerName, std::filesystem::path file, Logger& logger);

    // Disable copying
    FileHistoryProvider(const FileHistoryProvider&) = delete;
    FileHistoryProvider& operator=(const FileHistoryProvider&) = delete;

    std::string_view name() const override { return this->providerName; }
    bool isAvailable() override;
    std::vector<HistoryEntry> search(std::string_view query, const HistorySearchOptions& options) override;
    bool add(const HistoryEntry& entry) override;
    std::vector<HistoryEntry> getRecent(size_t limit) override;
    std::vector<HistoryEntry> getAll() override;
    HistoryStats getStats() override;
    void clear() override;

    const std::filesystem::path& getFile() const { return this->file; }

protected:
    /**
     * Parse file content into entries, oldest first
     */
    virtual std::vector<HistoryEntry> parseContent(std::string_view content) const = 0;

private:
    void reloadIfChanged();

    std::string providerName;
    std::filesystem::path file;
    Logger& logger;
    std::vector<HistoryEntry> entries;

    struct FileSignature {
        std::filesystem::file_time_type modified;
        std::uintmax_t size = 0;

        bool operator==(const FileSignature&) const = default;
    };
    std::optional<FileSignature> loadedSignature;
};

} // namespace shellsense
