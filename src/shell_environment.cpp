#include <shellsense/shell_environment.h>

#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <pwd.h>

extern char** environ;

namespace shellsense {

namespace fs = std::filesystem;

ShellFamily detectShellFamily(std::string_view shellPath) {
    std::string_view shellName = shellPath;
    if (auto slash = shellPath.find_last_of('/'); slash != std::string_view::npos) {
        shellName = shellPath.substr(slash + 1);
    }

    if (shellName == "zsh" || shellPath.find("zsh") != std::string_view::npos) {
        return ShellFamily::Zsh;
    }
    if (shellName == "bash" || shellPath.find("bash") != std::string_view::npos) {
        return ShellFamily::Bash;
    }
    if (shellName == "fish" || shellPath.find("fish") != std::string_view::npos) {
        return ShellFamily::Fish;
    }
    return ShellFamily::Generic;
}

std::string_view shellFamilyName(ShellFamily family) {
    switch (family) {
        case ShellFamily::Generic: return "generic";
        case ShellFamily::Bash: return "bash";
        case ShellFamily::Zsh: return "zsh";
        case ShellFamily::Fish: return "fish";
    }
    return "generic";
}

bool isExecutableFile(const fs::path& path) {
    struct stat st{};
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    if (!S_ISREG(st.st_mode)) {
        return false;
    }
    return (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) != 0;
}

ShellEnvironment::ShellEnvironment(std::map<std::string, std::string> variables)
    : variables(std::move(variables))
{
}

ShellEnvironment ShellEnvironment::capture() {
    std::map<std::string, std::string> variables;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view pair(*entry);
        auto equals = pair.find('=');
        if (equals == std::string_view::npos || equals == 0) {
            continue;
        }
        variables.emplace(std::string(pair.substr(0, equals)), std::string(pair.substr(equals + 1)));
    }
    return ShellEnvironment(std::move(variables));
}

std::optional<std::string> ShellEnvironment::get(const std::string& name) const {
    auto it = this->variables.find(name);
    if (it == this->variables.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ShellEnvironment::getOr(const std::string& name, std::string fallback) const {
    auto value = this->get(name);
    if (!value || value->empty()) {
        return fallback;
    }
    return *value;
}

void ShellEnvironment::set(const std::string& name, std::string value) {
    this->variables[name] = std::move(value);
}

std::vector<fs::path> ShellEnvironment::getPathDirectories() const {
    std::vector<fs::path> directories;
    auto pathValue = this->get("PATH");
    if (!pathValue) {
        return directories;
    }

    std::istringstream pathStream(*pathValue);
    std::string directory;
    while (std::getline(pathStream, directory, ':')) {
        if (!directory.empty()) {
            directories.emplace_back(directory);
        }
    }
    return directories;
}

fs::path ShellEnvironment::getHomeDirectory() const {
    if (auto home = this->get("HOME"); home && !home->empty()) {
        return *home;
    }
    if (struct passwd* pw = getpwuid(getuid())) {
        return pw->pw_dir;
    }
    return {};
}

std::string ShellEnvironment::expandTilde(const std::string& path) const {
    if (path.empty() || path[0] != '~') {
        return path;
    }

    // ~ or ~/...
    if (path.length() == 1 || path[1] == '/') {
        fs::path home = this->getHomeDirectory();
        if (home.empty()) {
            return path;
        }
        return home.string() + path.substr(1);
    }

    // ~username or ~username/...
    size_t slashPos = path.find('/');
    std::string username = path.substr(1, slashPos == std::string::npos ? std::string::npos : slashPos - 1);
    if (struct passwd* pw = getpwnam(username.c_str())) {
        if (slashPos == std::string::npos) {
            return std::string(pw->pw_dir);
        }
        return std::string(pw->pw_dir) + path.substr(slashPos);
    }
    return path;
}

std::optional<fs::path> ShellEnvironment::findExecutable(const std::string& name) const {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        if (isExecutableFile(name)) {
            return fs::path(name);
        }
        return std::nullopt;
    }
    for (const auto& directory : this->getPathDirectories()) {
        fs::path candidate = directory / name;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::string ShellEnvironment::getShellPath() const {
    return this->getOr("SHELL", "/bin/sh");
}

} // namespace shellsense
