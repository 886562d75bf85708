#pragma once

#include <shellsense/shell/generic_shell_backend.h>

namespace shellsense {

/**
 * Generic backend plus bash builtins and `compgen`.
 * compgen is checked once at initialize(); without it this backend behaves
 * like the generic one apart from the builtin list.
 */
class BashShellBackend : public GenericShellBackend {
public:
    using GenericShellBackend::GenericShellBackend;

    std::string_view name() const override { return "bash"; }
    void initialize() override;
    std::vector<std::string> listBuiltins() const override;

    bool isCompgenAvailable() const { return this->compgenAvailable; }

protected:
    std::vector<CompletionCandidate> resolveCommands(const CompletionContext& context) override;
    std::vector<CompletionCandidate> resolveArguments(const CompletionContext& context) override;

private:
    std::vector<std::string> compgen(const std::string& action, const std::string& prefix, const std::string& workingDirectory) const;

    bool compgenAvailable = false;
};

} // namespace shellsense
