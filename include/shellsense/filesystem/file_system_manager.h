#pragma once

#include <filesystem>
#include <string>

namespace shellsense {

/**
 * Locates the writable data directory of the application.
 *
 * The directory comes from sago::getDataHome():
 * - Linux: $XDG_DATA_HOME/<appName>/ or ~/.local/share/<appName>/
 * - macOS: ~/Library/Application Support/<appName>/
 * - Windows: %APPDATA%/<appName>/
 */
class FileSystemManager {
public:
    explicit FileSystemManager(const std::string& appName = "shellsense");

    /**
     * Use an explicit directory instead of the platform data home
     */
    FileSystemManager(const std::string& appName, std::filesystem::path writablePath);

    /**
     * Create the data directory if it doesn't exist.
     * @return false if the directory could not be created
     */
    bool initialize();

    std::filesystem::path getWritablePath() const;

    /**
     * Default location of the owned history store
     */
    std::filesystem::path getDefaultHistoryPath() const;

    /**
     * Default location of the JSON configuration file
     */
    std::filesystem::path getDefaultConfigPath() const;

private:
    std::string appName;
    std::filesystem::path writablePath;
};

} // namespace shellsense
