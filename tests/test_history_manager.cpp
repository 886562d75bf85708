#include <catch2/catch_test_macros.hpp>
#include <shellsense/history/history_manager.h>
#include "HistoryProviderMock.h"
#include "LoggerMock.h"
#include "TemporaryDirectory.h"

using namespace shellsense;

namespace {

std::vector<std::string> commands(const std::vector<HistoryEntry>& entries) {
    std::vector<std::string> result;
    for (const auto& entry : entries) {
        result.push_back(entry.command);
    }
    return result;
}

HistoryEntry entryFor(const std::string& command, std::optional<int64_t> timestamp = std::nullopt) {
    HistoryEntry entry;
    entry.command = command;
    entry.timestamp = timestamp;
    return entry;
}

struct ManagerFixture {
    LoggerMock logger;
    HistoryProviderMock* owned = nullptr;
    HistoryProviderMock* shell = nullptr;

    std::unique_ptr<HistoryManager> create(HistoryMode mode) {
        auto ownedProvider = std::make_unique<HistoryProviderMock>("shellsense");
        auto shellProvider = std::make_unique<HistoryProviderMock>("bash");
        this->owned = ownedProvider.get();
        this->shell = shellProvider.get();
        return std::make_unique<HistoryManager>(mode, std::move(ownedProvider), std::move(shellProvider),
                                                HistorySearchOptions{50, true}, this->logger);
    }
};

} // namespace

TEST_CASE("History modes by name", "[history][manager]") {
    REQUIRE(historyModeFromString("solo") == HistoryMode::Solo);
    REQUIRE(historyModeFromString("aish") == HistoryMode::Solo);
    REQUIRE(historyModeFromString("shell") == HistoryMode::ShellOnly);
    REQUIRE(historyModeFromString("shell-only") == HistoryMode::ShellOnly);
    REQUIRE(historyModeFromString("unified") == HistoryMode::Unified);
    REQUIRE_FALSE(historyModeFromString("everything").has_value());
    REQUIRE(historyModeName(HistoryMode::ShellOnly) == "shell");
}

TEST_CASE("mergeResults orders, deduplicates and truncates", "[history][manager]") {
    std::vector<std::vector<HistoryEntry>> results = {
        {entryFor("a", 10), entryFor("b", 20), entryFor("x")},
        {entryFor("a", 5), entryFor("c")}
    };

    REQUIRE(commands(HistoryManager::mergeResults(results, 10)) == std::vector<std::string>{"b", "a", "x", "c"});
    REQUIRE(commands(HistoryManager::mergeResults(results, 3)) == std::vector<std::string>{"b", "a", "x"});
    REQUIRE(commands(HistoryManager::mergeResults(results, 10, false)) == std::vector<std::string>{"b", "a", "a", "x", "c"});

    auto merged = HistoryManager::mergeResults(results, 10);
    REQUIRE(merged[1].timestamp == 10);
}

TEST_CASE("mergeResults gives the same order on identical input", "[history][manager]") {
    std::vector<std::vector<HistoryEntry>> results = {
        {entryFor("make", 30), entryFor("ls"), entryFor("git push", 30), entryFor("pwd")},
        {entryFor("make", 30), entryFor("vim", 40), entryFor("ls"), entryFor("top", 10)}
    };

    auto first = HistoryManager::mergeResults(results, 50);
    auto second = HistoryManager::mergeResults(results, 50);
    REQUIRE(commands(first) == std::vector<std::string>{"vim", "make", "git push", "top", "ls", "pwd"});
    REQUIRE(second == first);
}

TEST_CASE("HistoryManager routes by mode", "[history][manager]") {
    ManagerFixture fixture;

    SECTION("Unified asks both providers") {
        auto manager = fixture.create(HistoryMode::Unified);
        fixture.owned->searchReturnValue = {entryFor("git push", 200)};
        fixture.shell->searchReturnValue = {entryFor("git status", 300), entryFor("git push", 100)};

        auto results = manager->search("git");
        REQUIRE(commands(results) == std::vector<std::string>{"git status", "git push"});
        REQUIRE(results[1].timestamp == 200);
        REQUIRE(fixture.owned->calls == std::vector<HistoryProviderMock::Call>{HistoryProviderMock::SearchCall{"git", 50, true}});
        REQUIRE(fixture.shell->calls == std::vector<HistoryProviderMock::Call>{HistoryProviderMock::SearchCall{"git", 50, true}});
    }

    SECTION("Unified without a readable shell log uses the owned store") {
        auto manager = fixture.create(HistoryMode::Unified);
        fixture.shell->isAvailableReturnValue = false;
        manager->search("git");
        REQUIRE(fixture.owned->calls.size() == 1);
        REQUIRE(fixture.shell->calls.empty());
    }

    SECTION("Solo never reads the shell log") {
        auto manager = fixture.create(HistoryMode::Solo);
        manager->search("git", HistorySearchOptions{5, false});
        REQUIRE(fixture.owned->calls == std::vector<HistoryProviderMock::Call>{HistoryProviderMock::SearchCall{"git", 5, false}});
        REQUIRE(fixture.shell->calls.empty());
    }

    SECTION("Shell-only reads the shell log") {
        auto manager = fixture.create(HistoryMode::ShellOnly);
        manager->search("git");
        REQUIRE(fixture.owned->calls.empty());
        REQUIRE(fixture.shell->calls.size() == 1);
    }

    SECTION("Shell-only falls back to the owned store") {
        auto manager = fixture.create(HistoryMode::ShellOnly);
        fixture.shell->isAvailableReturnValue = false;
        manager->search("git");
        REQUIRE(fixture.owned->calls.size() == 1);
        REQUIRE(fixture.shell->calls.empty());
    }

    SECTION("Writes go to the owned store only") {
        auto manager = fixture.create(HistoryMode::ShellOnly);
        REQUIRE(manager->add(entryFor("make")));
        manager->clear();
        REQUIRE(manager->flush());
        REQUIRE(fixture.owned->calls == std::vector<HistoryProviderMock::Call>{
            HistoryProviderMock::AddCall{"make"},
            HistoryProviderMock::ClearCall{},
            HistoryProviderMock::FlushCall{}
        });
        REQUIRE(fixture.shell->calls.empty());
    }
}

TEST_CASE("HistoryManager recent entries and stats", "[history][manager]") {
    ManagerFixture fixture;
    auto manager = fixture.create(HistoryMode::Unified);
    fixture.owned->getRecentReturnValue = {entryFor("c", 30), entryFor("a", 10)};
    fixture.shell->getRecentReturnValue = {entryFor("b", 20), entryFor("a", 5)};

    SECTION("Recent entries are split across providers") {
        auto recent = manager->getRecent(3);
        REQUIRE(commands(recent) == std::vector<std::string>{"c", "b", "a"});
        REQUIRE(fixture.owned->calls == std::vector<HistoryProviderMock::Call>{HistoryProviderMock::GetRecentCall{2}});
        REQUIRE(fixture.shell->calls == std::vector<HistoryProviderMock::Call>{HistoryProviderMock::GetRecentCall{2}});
    }

    SECTION("Stats per provider plus combined") {
        fixture.owned->getAllReturnValue = {entryFor("git push", 30), entryFor("ls", 10)};
        fixture.shell->getAllReturnValue = {entryFor("git status", 20)};

        auto stats = manager->getStats();
        REQUIRE(stats.size() == 3);
        REQUIRE(stats.at("shellsense").total == 2);
        REQUIRE(stats.at("bash").total == 1);
        REQUIRE(stats.at("combined").total == 3);
        REQUIRE(stats.at("combined").topCommands.front().command == "git");
        REQUIRE(stats.at("combined").topCommands.front().count == 2);
    }

    SECTION("Export is oldest first") {
        fixture.owned->getAllReturnValue = {entryFor("git push", 30), entryFor("ls", 10)};
        fixture.shell->getAllReturnValue = {entryFor("git status", 20)};
        REQUIRE(manager->exportTo("plain") == "ls\ngit status\ngit push");
    }
}

TEST_CASE("HistoryManager::create", "[history][manager]") {
    TemporaryDirectory directory;
    LoggerMock logger;
    ShellEnvironment environment(std::map<std::string, std::string>{{"HOME", directory.getPath().string()}});

    HistoryConfig config;
    config.file = directory.getPath() / "history.jsonl";

    SECTION("Unknown mode warns and uses solo") {
        config.mode = "everything";
        auto manager = HistoryManager::create(config, environment, ShellFamily::Bash, logger);
        REQUIRE(manager->getMode() == HistoryMode::Solo);
        REQUIRE(manager->getShellProvider() == nullptr);
        REQUIRE(logger.hasMessage(LogLevel::Warning, "everything"));
    }

    SECTION("Shell provider follows the shell family") {
        auto zsh = HistoryManager::create(config, environment, ShellFamily::Zsh, logger);
        REQUIRE(zsh->getShellProvider()->name() == "zsh");

        auto fish = HistoryManager::create(config, environment, ShellFamily::Fish, logger);
        REQUIRE(fish->getShellProvider()->name() == "fish");

        auto generic = HistoryManager::create(config, environment, ShellFamily::Generic, logger);
        REQUIRE(generic->getShellProvider()->name() == "bash");
    }

    SECTION("Disabled provider is not created") {
        config.providers.zsh = false;
        auto manager = HistoryManager::create(config, environment, ShellFamily::Zsh, logger);
        REQUIRE(manager->getShellProvider() == nullptr);
    }

    SECTION("Added commands reach the file and merge with the shell log") {
        directory.writeFile(".bash_history", "ls\n");
        auto manager = HistoryManager::create(config, environment, ShellFamily::Bash, logger);
        HistoryEntry entry;
        entry.command = "make";
        REQUIRE(manager->add(entry));
        REQUIRE(manager->flush());
        REQUIRE(commands(manager->search("")) == std::vector<std::string>{"make", "ls"});
        REQUIRE(directory.readFile("history.jsonl").find("\"make\"") != std::string::npos);
    }
}
