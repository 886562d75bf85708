#include <shellsense/shell/shell_backend_factory.h>
#include <shellsense/shell/bash_shell_backend.h>
#include <shellsense/shell/generic_shell_backend.h>
#include <shellsense/shell/zsh_shell_backend.h>

namespace shellsense {

std::unique_ptr<ShellBackend> makeShellBackend(std::string_view backendName, ShellFamily family, const BackendServices& services) {
    std::string_view selected = backendName;
    if (selected == "auto") {
        switch (family) {
            case ShellFamily::Bash: selected = "bash"; break;
            case ShellFamily::Zsh: selected = "zsh"; break;
            case ShellFamily::Fish:
            case ShellFamily::Generic: selected = "generic"; break;
        }
    }

    if (selected == "bash") {
        return std::make_unique<BashShellBackend>(services);
    }
    if (selected == "zsh") {
        return std::make_unique<ZshShellBackend>(services);
    }
    if (selected != "generic") {
        services.logger.warn("ShellBackend: unknown backend '{}', using generic", backendName);
    }
    return std::make_unique<GenericShellBackend>(services);
}

} // namespace shellsense
