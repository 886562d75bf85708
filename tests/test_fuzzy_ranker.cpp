#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <shellsense/fuzzy/fallback_ranker.h>
#include <shellsense/fuzzy/fuzzy_ranker_factory.h>
#include <shellsense/fuzzy/fzf_ranker.h>
#include <shellsense/fuzzy/levenshtein_ranker.h>
#include <shellsense/fuzzy/subsequence_ranker.h>
#include "LoggerMock.h"
#include "ProcessRunnerMock.h"

using namespace shellsense;
using Catch::Approx;

namespace {

std::vector<size_t> indices(const std::vector<RankedItem>& items) {
    std::vector<size_t> result;
    for (const auto& item : items) {
        result.push_back(item.index);
    }
    return result;
}

// Expected argv and stdin of a filter run
ProcessRunnerMock::Call fzfFilterCall(const std::string& query, const std::string& input) {
    return ProcessRunnerMock::RunCall{{"fzf", "--filter", query, "--no-sort", "--tiebreak=index", "-i"}, input};
}

} // namespace

TEST_CASE("SubsequenceRanker scores", "[fuzzy]") {
    SubsequenceRanker ranker;

    SECTION("Exact, prefix and substring matches") {
        REQUIRE(ranker.score("git", "git").score == 1.0);
        REQUIRE(ranker.score("GIT", "git").score == 1.0);

        auto prefix = ranker.score("gi", "git");
        REQUIRE(prefix.score == Approx(0.9));
        REQUIRE(prefix.spans == std::vector<MatchSpan>{{0, 2}});

        auto substring = ranker.score("it", "git");
        REQUIRE(substring.score == Approx(0.8));
        REQUIRE(substring.spans == std::vector<MatchSpan>{{1, 3}});
    }

    SECTION("Subsequence across word boundaries") {
        auto match = ranker.score("gco", "git-checkout");
        // g(1.5+2) c(1.5+2) o(1.5) = 8.5 / 9, length factor 1 - 0.2 * 9/12
        REQUIRE(match.score == Approx(8.5 / 9.0 * 0.85));
        REQUIRE(match.spans == std::vector<MatchSpan>{{0, 1}, {4, 5}, {9, 10}});
    }

    SECTION("Typo tolerance for transposed characters") {
        REQUIRE(ranker.score("gti", "git").score == Approx(0.5 * (1.0 - 1.0 / 3.0)));
        REQUIRE(ranker.score("xyz", "git").score == 0.0);
        REQUIRE(SubsequenceRanker(0).score("gti", "git").score == 0.0);
    }

    SECTION("Short queries are not typo matched") {
        REQUIRE(ranker.score("tg", "git").score == 0.0);
    }

    SECTION("Empty text never matches") {
        REQUIRE(ranker.score("a", "").score == 0.0);
    }
}

TEST_CASE("ScoringRanker ranks by score and keeps input order on ties", "[fuzzy]") {
    SubsequenceRanker ranker;
    std::vector<std::string> texts = {"status", "commit", "stash"};

    SECTION("Zero scores are dropped") {
        auto ranked = ranker.rank("sta", texts);
        REQUIRE(ranked.has_value());
        REQUIRE(indices(*ranked) == std::vector<size_t>{0, 2});
    }

    SECTION("Empty query returns everything") {
        auto ranked = ranker.rank("", texts);
        REQUIRE(ranked.has_value());
        REQUIRE(indices(*ranked) == std::vector<size_t>{0, 1, 2});
        REQUIRE((*ranked)[1].match.score == 1.0);
    }

    SECTION("Better matches first") {
        auto ranked = ranker.rank("stash", texts);
        REQUIRE(ranked.has_value());
        REQUIRE(indices(*ranked).front() == 2);
    }
}

TEST_CASE("Single letter query against config and get", "[fuzzy]") {
    SubsequenceRanker ranker;

    auto get = ranker.score("g", "get");
    auto config = ranker.score("g", "config");
    REQUIRE(get.score == Approx(0.9));
    REQUIRE(config.score == Approx(0.8));
    REQUIRE(config.spans == std::vector<MatchSpan>{{5, 6}});

    const std::vector<std::string> texts = {"config", "get"};
    auto first = ranker.rank("g", texts);
    auto second = ranker.rank("g", texts);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(indices(*first) == std::vector<size_t>{1, 0});
    REQUIRE(indices(*second) == indices(*first));
}

TEST_CASE("Edit distances", "[fuzzy]") {
    REQUIRE(levenshteinDistance("kitten", "sitting") == 3);
    REQUIRE(levenshteinDistance("", "abc") == 3);
    REQUIRE(levenshteinDistance("ab", "ba") == 2);
    REQUIRE(optimalStringAlignmentDistance("ab", "ba") == 1);

    LevenshteinRanker ranker(3);
    REQUIRE(ranker.score("git", "git").score == 1.0);
    REQUIRE(ranker.score("gti", "git").score == Approx(1.0 - 2.0 / 3.0));
    REQUIRE(ranker.score("abcdefgh", "z").score == 0.0);
}

TEST_CASE("FzfRanker runs the helper", "[fuzzy][fzf]") {
    ProcessRunnerMock runner;
    LoggerMock logger;
    int filterExitCode = 0;
    std::string filterOutput = "stash\nstatus\n";
    runner.runHandler = [&](const ProcessRequest& request) {
        if (request.argv.size() == 2 && request.argv[1] == "--version") {
            return ProcessRunnerMock::exited(0, "0.44.1\n");
        }
        return ProcessRunnerMock::exited(filterExitCode, filterOutput);
    };
    FzfRanker ranker(runner, logger);
    std::vector<std::string> texts = {"status", "stash", "commit"};

    SECTION("Output order is authoritative") {
        auto ranked = ranker.rank("sta", texts);
        REQUIRE(ranked.has_value());
        REQUIRE(indices(*ranked) == std::vector<size_t>{1, 0});
        REQUIRE((*ranked)[0].match.score == 1.0);
        REQUIRE((*ranked)[1].match.score == Approx(0.5));

        REQUIRE(runner.calls.size() == 2);
        REQUIRE(runner.calls[0] == ProcessRunnerMock::Call{ProcessRunnerMock::RunCall{{"fzf", "--version"}, ""}});
        REQUIRE(runner.calls[1] == fzfFilterCall("sta", "status\nstash\ncommit\n"));
    }

    SECTION("Availability is checked once") {
        REQUIRE(ranker.rank("sta", texts).has_value());
        REQUIRE(ranker.rank("st", texts).has_value());
        REQUIRE(runner.calls.size() == 3);
    }

    SECTION("Exit code 1 means no matches") {
        filterExitCode = 1;
        filterOutput.clear();
        auto ranked = ranker.rank("zzz", texts);
        REQUIRE(ranked.has_value());
        REQUIRE(ranked->empty());
        REQUIRE(ranker.isAvailable());
    }

    SECTION("Other failures make the helper unavailable") {
        filterExitCode = 2;
        REQUIRE_FALSE(ranker.rank("sta", texts).has_value());
        REQUIRE_FALSE(ranker.isAvailable());
    }

    SECTION("Duplicate texts map back in input order") {
        filterOutput = "same\nsame\n";
        auto ranked = ranker.rank("sa", {"same", "other", "same"});
        REQUIRE(ranked.has_value());
        REQUIRE(indices(*ranked) == std::vector<size_t>{0, 2});
    }

    SECTION("Embedded newlines are flattened") {
        filterOutput = "echo a b\n";
        auto ranked = ranker.rank("echo", {"echo a\nb"});
        REQUIRE(ranked.has_value());
        REQUIRE(indices(*ranked) == std::vector<size_t>{0});
        REQUIRE(runner.calls[1] == fzfFilterCall("echo", "echo a b\n"));
    }
}

TEST_CASE("FzfRanker without fzf installed", "[fuzzy][fzf]") {
    ProcessRunnerMock runner;
    LoggerMock logger;
    runner.runReturnValue = ProcessRunnerMock::launchFailed();
    FzfRanker ranker(runner, logger);

    REQUIRE_FALSE(ranker.isAvailable());
    REQUIRE_FALSE(ranker.rank("a", {"abc"}).has_value());
    REQUIRE(runner.calls.size() == 1);
}

TEST_CASE("FallbackRanker uses the subsequence scorer when fzf is missing", "[fuzzy]") {
    ProcessRunnerMock runner;
    LoggerMock logger;
    runner.runReturnValue = ProcessRunnerMock::launchFailed();
    FallbackRanker ranker(std::make_unique<FzfRanker>(runner, logger),
                          std::make_unique<SubsequenceRanker>(),
                          logger);

    REQUIRE(ranker.name() == "fzf");
    auto ranked = ranker.rank("sta", {"status", "commit", "stash"});
    REQUIRE(ranked.has_value());
    REQUIRE(indices(*ranked) == std::vector<size_t>{0, 2});
    REQUIRE(ranker.name() == "subsequence");

    // The failed helper is not asked again
    ranker.rank("com", {"status", "commit"});
    REQUIRE(runner.calls.size() == 1);
}

TEST_CASE("makeFuzzyRanker selects a strategy", "[fuzzy]") {
    ProcessRunnerMock runner;
    LoggerMock logger;
    runner.runReturnValue = ProcessRunnerMock::launchFailed();
    FuzzyConfig config;

    REQUIRE(makeFuzzyRanker(config, "subsequence", runner, logger)->name() == "subsequence");
    REQUIRE(makeFuzzyRanker(config, "levenshtein", runner, logger)->name() == "levenshtein");
    REQUIRE(makeFuzzyRanker(config, "auto", runner, logger)->name() == "fzf");
    REQUIRE(logger.messages.empty());

    SECTION("Unknown strategy warns") {
        auto ranker = makeFuzzyRanker(config, "quantum", runner, logger);
        REQUIRE(ranker->name() == "fzf");
        REQUIRE(logger.hasMessage(LogLevel::Warning, "quantum"));
    }

    SECTION("Explicit fzf warns when it is missing") {
        auto ranker = makeFuzzyRanker(config, "fzf", runner, logger);
        REQUIRE(logger.hasMessage(LogLevel::Warning, "not available"));
        REQUIRE(ranker->rank("a", {"abc"}).has_value());
    }
}
