#pragma once

#include <shellsense/history/file_history_provider.h>
#include <shellsense/shell_environment.h>

namespace shellsense {

/**
 * ~/.bash_history: one command per line, "\" at the end of a line continues
 * the command on the next one. "#<epoch>" lines written with HISTTIMEFORMAT
 * are skipped; their timestamps are not attached to commands.
 */
class BashHistoryProvider : public FileHistoryProvider {
public:
    BashHistoryProvider(std::filesystem::path file, Logger& logger);

    static std::vector<HistoryEntry> parse(std::string_view content);

    /**
     * $HISTFILE, else ~/.bash_history
     */
    static std::filesystem::path locateFile(const ShellEnvironment& environment);

protected:
    std::vector<HistoryEntry> parseContent(std::string_view content) const override { return parse(content); }
};

/**
 * zsh history in extended format ": <epoch>:<duration>;<command>".
 * Lines without the marker continue the previous annotated command; before
 * any marker they are plain legacy entries. Metafied bytes are decoded.
 */
class ZshHistoryProvider : public FileHistoryProvider {
public:
    ZshHistoryProvider(std::filesystem::path file, Logger& logger);

    static std::vector<HistoryEntry> parse(std::string_view content);

    /**
     * $HISTFILE, else the first existing of ~/.zsh_history, ~/.zhistory, ~/.history
     */
    static std::filesystem::path locateFile(const ShellEnvironment& environment);

protected:
    std::vector<HistoryEntry> parseContent(std::string_view content) const override { return parse(content); }
};

/**
 * fish history:
 *   - cmd: <command>
 *     when: <epoch>
 *     paths:
 *       - <directory>
 */
class FishHistoryProvider : public FileHistoryProvider {
public:
    FishHistoryProvider(std::filesystem::path file, Logger& logger);

    static std::vector<HistoryEntry> parse(std::string_view content);

    /**
     * $XDG_DATA_HOME/fish/<session>_history where the session comes from
     * $fish_history (default "fish")
     */
    static std::filesystem::path locateFile(const ShellEnvironment& environment);

protected:
    std::vector<HistoryEntry> parseContent(std::string_view content) const override { return parse(content); }
};

} // namespace shellsense
