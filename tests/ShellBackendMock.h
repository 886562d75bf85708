#pragma once

#include <shellsense/shell/shell_backend.h>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

/**
 * Mock ShellBackend for unit tests
 * Records all calls for verification
 */
class ShellBackendMock : public shellsense::ShellBackend {
public:
    struct InitializeCall {
        bool operator==(const InitializeCall&) const = default;
        friend std::ostream& operator<<(std::ostream& os, const InitializeCall&) {
            return os << "InitializeCall{}";
        }
    };

    struct ResolveCall {
        std::string currentWord;
        shellsense::CompletionSlot slot = shellsense::CompletionSlot::Command;
        bool operator==(const ResolveCall&) const = default;
        friend std::ostream& operator<<(std::ostream& os, const ResolveCall& c) {
            return os << "ResolveCall{currentWord=" << c.currentWord
                      << ", slot=" << shellsense::slotName(c.slot) << "}";
        }
    };

    using Call = std::variant<InitializeCall, ResolveCall>;

    friend std::ostream& operator<<(std::ostream& os, const Call& call) {
        std::visit([&os](const auto& c) { os << c; }, call);
        return os;
    }

    // Call recording
    std::vector<Call> calls;

    // Configurable return values
    std::vector<shellsense::CompletionCandidate> resolveReturnValue;
    std::vector<std::string> listBuiltinsReturnValue;

    std::string_view name() const override { return "mock"; }

    void initialize() override {
        this->calls.push_back(InitializeCall{});
    }

    std::vector<shellsense::CompletionCandidate> resolve(const shellsense::CompletionContext& context) override {
        this->calls.push_back(ResolveCall{context.currentWord, context.slot});
        return this->resolveReturnValue;
    }

    std::vector<std::string> listBuiltins() const override {
        return this->listBuiltinsReturnValue;
    }
};
