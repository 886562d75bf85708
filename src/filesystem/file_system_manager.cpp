#include <shellsense/filesystem/file_system_manager.h>
#include <sago/platform_folders.h>
#include <system_error>

namespace shellsense {

FileSystemManager::FileSystemManager(const std::string& appName)
    : appName(appName)
    , writablePath(std::filesystem::path(sago::getDataHome()) / this->appName) {
}

FileSystemManager::FileSystemManager(const std::string& appName, std::filesystem::path writablePath)
    : appName(appName)
    , writablePath(std::move(writablePath)) {
}

bool FileSystemManager::initialize() {
    std::error_code ec;
    std::filesystem::create_directories(this->writablePath, ec);
    return !ec && std::filesystem::is_directory(this->writablePath, ec);
}

std::filesystem::path FileSystemManager::getWritablePath() const {
    return this->writablePath;
}

std::filesystem::path FileSystemManager::getDefaultHistoryPath() const {
    return this->writablePath / "history.jsonl";
}

std::filesystem::path FileSystemManager::getDefaultConfigPath() const {
    return std::filesystem::path(sago::getConfigHome()) / this->appName / "config.json";
}

} // namespace shellsense
