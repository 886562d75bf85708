#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shellsense {

enum class ShellFamily {
    Generic,
    Bash,
    Zsh,
    Fish
};

/**
 * Guess the shell family from a shell path such as "/usr/bin/zsh" or a
 * Guix-style store path containing the shell name.
 */
ShellFamily detectShellFamily(std::string_view shellPath);
std::string_view shellFamilyName(ShellFamily family);

/**
 * Snapshot of environment variables taken once by the host.
 * Completion sources read variables from here instead of getenv().
 */
class ShellEnvironment {
public:
    ShellEnvironment() = default;
    explicit ShellEnvironment(std::map<std::string, std::string> variables);

    /**
     * Capture the current process environment
     */
    static ShellEnvironment capture();

    std::optional<std::string> get(const std::string& name) const;
    std::string getOr(const std::string& name, std::string fallback) const;
    void set(const std::string& name, std::string value);

    const std::map<std::string, std::string>& getVariables() const { return this->variables; }

    /**
     * PATH split into directories, empty entries removed
     */
    std::vector<std::filesystem::path> getPathDirectories() const;

    /**
     * Home directory: $HOME, then the passwd entry of the current user
     */
    std::filesystem::path getHomeDirectory() const;

    /**
     * Expand ~ and ~user prefixes. Paths that cannot be expanded are returned as is.
     */
    std::string expandTilde(const std::string& path) const;

    /**
     * Locate an executable by name through PATH.
     * Names containing '/' are checked directly.
     */
    std::optional<std::filesystem::path> findExecutable(const std::string& name) const;

    /**
     * Shell path from $SHELL, "/bin/sh" if unset
     */
    std::string getShellPath() const;

private:
    std::map<std::string, std::string> variables;
};

/**
 * True if path is a regular file with an execute bit set
 */
bool isExecutableFile(const std::filesystem::path& path);

} // namespace shellsense
