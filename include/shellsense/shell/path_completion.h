#pragma once

#include <shellsense/completion_types.h>
#include <shellsense/shell_environment.h>
#include <string>
#include <string_view>
#include <vector>

namespace shellsense {

/**
 * Filesystem entries matching a raw path word.
 *
 * The directory part of the word is resolved against workingDirectory with
 * ~ expanded for the lookup only; the returned text keeps the word's own
 * prefix. Directories end in '/'. Hidden entries are listed only when the
 * basename prefix starts with '.'. Names are escaped with backslashes unless
 * the word opened a quote. Results are sorted by name.
 */
std::vector<CompletionCandidate> completePath(std::string_view word,
                                              const std::string& workingDirectory,
                                              const ShellEnvironment& environment,
                                              bool directoriesOnly = false);

/**
 * Backslash-escape characters the shell would otherwise interpret
 */
std::string escapeForShell(std::string_view text);

} // namespace shellsense
