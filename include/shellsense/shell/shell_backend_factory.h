#pragma once

#include <shellsense/shell/shell_backend.h>
#include <shellsense/shell_environment.h>
#include <memory>
#include <string_view>

namespace shellsense {

/**
 * Create a backend by name: "generic", "bash", "zsh", or "auto" to pick by
 * shell family (fish and unknown shells get the generic backend).
 * Unknown names log a warning and fall back to generic.
 */
std::unique_ptr<ShellBackend> makeShellBackend(std::string_view backendName, ShellFamily family, const BackendServices& services);

} // namespace shellsense
