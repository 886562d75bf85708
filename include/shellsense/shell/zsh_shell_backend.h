#pragma once

#include <shellsense/shell/generic_shell_backend.h>
#include <set>

namespace shellsense {

/**
 * Generic backend plus zsh builtins and the command hash table of a
 * non-interactive `zsh -f`, loaded at initialize() and on rehash()
 */
class ZshShellBackend : public GenericShellBackend {
public:
    using GenericShellBackend::GenericShellBackend;

    std::string_view name() const override { return "zsh"; }
    void initialize() override;
    void rehash() override;
    std::vector<std::string> listBuiltins() const override;

    bool isZshAvailable() const { return this->zshAvailable; }

protected:
    std::vector<CompletionCandidate> resolveCommands(const CompletionContext& context) override;

private:
    void loadCommandTable();

    bool zshAvailable = false;
    std::set<std::string> zshCommands;
};

} // namespace shellsense
