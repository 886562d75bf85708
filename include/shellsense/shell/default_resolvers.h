#pragma once

#include <shellsense/shell/command_resolver.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shellsense {

std::vector<CompletionCandidate> resolveGit(const CompletionContext& context, const BackendServices& services);
std::vector<CompletionCandidate> resolvePackageScripts(const CompletionContext& context, const BackendServices& services);
std::vector<CompletionCandidate> resolveContainers(const CompletionContext& context, const BackendServices& services);
std::vector<CompletionCandidate> resolveProcesses(const CompletionContext& context, const BackendServices& services);
std::vector<CompletionCandidate> resolveHosts(const CompletionContext& context, const BackendServices& services);
std::vector<CompletionCandidate> resolveDirectories(const CompletionContext& context, const BackendServices& services);

/**
 * Script names and commands from the "scripts" object of a package.json document
 */
std::vector<std::pair<std::string, std::string>> parsePackageScripts(std::string_view packageJson);

/**
 * Host names from ~/.ssh/known_hosts; hashed and [host]:port entries are skipped
 */
std::vector<std::string> parseKnownHosts(std::string_view content);

/**
 * Host aliases from "Host" lines of ~/.ssh/config; patterns with wildcards are skipped
 */
std::vector<std::string> parseSshConfigHosts(std::string_view content);

/**
 * Host names and aliases from /etc/hosts
 */
std::vector<std::string> parseEtcHosts(std::string_view content);

/**
 * (pid, command) pairs from `ps -eo pid,comm` output; the header is skipped
 */
std::vector<std::pair<std::string, std::string>> parseProcessList(std::string_view output);

/**
 * Options listed in `--help` output: lines starting with '-' are split into
 * option names and a description
 */
std::vector<std::pair<std::string, std::string>> parseHelpOptions(std::string_view helpText);

} // namespace shellsense
