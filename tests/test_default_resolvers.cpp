#include <catch2/catch_test_macros.hpp>
#include <shellsense/command_line.h>
#include <shellsense/shell/command_resolver.h>
#include <shellsense/shell/default_resolvers.h>
#include "LoggerMock.h"
#include "ProcessRunnerMock.h"
#include "TemporaryDirectory.h"

using namespace shellsense;

namespace {

std::vector<std::string> texts(const std::vector<CompletionCandidate>& candidates) {
    std::vector<std::string> result;
    for (const auto& candidate : candidates) {
        result.push_back(candidate.text);
    }
    return result;
}

struct ResolverFixture {
    TemporaryDirectory home;
    ShellEnvironment environment;
    ProcessRunnerMock runner;
    LoggerMock logger;
    BackendServices services;

    ResolverFixture()
        : environment(std::map<std::string, std::string>{{"HOME", home.getPath().string()}})
        , services{runner, environment, logger}
    {
        this->services.etcHostsPath = this->home.getPath() / "etc-hosts";
    }

    CompletionContext context(const std::string& line) const {
        return classify(line, line.size(), this->home.getPath().string());
    }
};

} // namespace

TEST_CASE("Git resolver", "[resolvers][git]") {
    ResolverFixture fixture;

    SECTION("Subcommands") {
        auto candidates = resolveGit(fixture.context("git ch"), fixture.services);
        REQUIRE(texts(candidates) == std::vector<std::string>{"checkout", "cherry-pick"});
        REQUIRE(candidates[0].priority == 8);
        REQUIRE(fixture.runner.calls.empty());
    }

    SECTION("Branches after checkout") {
        fixture.runner.runReturnValue = ProcessRunnerMock::exited(0, "main\nmaster-old\nfeature/x\n");
        auto candidates = resolveGit(fixture.context("git checkout ma"), fixture.services);
        REQUIRE(texts(candidates) == std::vector<std::string>{"main", "master-old"});
        REQUIRE(candidates[0].description == "git branch");

        auto& call = std::get<ProcessRunnerMock::RunCall>(fixture.runner.calls.at(0));
        REQUIRE(call.argv.at(0) == "git");
        REQUIRE(call.argv.at(1) == "for-each-ref");
    }

    SECTION("Same name as branch and modified file appears once") {
        fixture.runner.runHandler = [](const ProcessRequest& request) {
            if (request.argv.at(1) == "status") {
                return ProcessRunnerMock::exited(0, " M main\n?? notes.txt\n");
            }
            return ProcessRunnerMock::exited(0, "main\n");
        };
        auto candidates = resolveGit(fixture.context("git diff "), fixture.services);
        REQUIRE(texts(candidates) == std::vector<std::string>{"main", "notes.txt"});
    }

    SECTION("Not a repository") {
        fixture.runner.runReturnValue = ProcessRunnerMock::exited(128);
        REQUIRE(resolveGit(fixture.context("git checkout "), fixture.services).empty());
    }
}

TEST_CASE("Package script resolver", "[resolvers][npm]") {
    ResolverFixture fixture;
    fixture.home.writeFile("package.json", R"({"name": "app", "scripts": {"build": "tsc -p .", "test": "jest", "bad": 1}})");

    SECTION("parsePackageScripts") {
        auto scripts = parsePackageScripts(fixture.home.readFile("package.json"));
        REQUIRE(scripts == std::vector<std::pair<std::string, std::string>>{{"build", "tsc -p ."}, {"test", "jest"}});
        REQUIRE(parsePackageScripts("not json").empty());
        REQUIRE(parsePackageScripts(R"({"scripts": []})").empty());
    }

    SECTION("Scripts after run") {
        auto candidates = resolvePackageScripts(fixture.context("npm run b"), fixture.services);
        REQUIRE(texts(candidates) == std::vector<std::string>{"build"});
        REQUIRE(candidates[0].description == "tsc -p .");
        REQUIRE(candidates[0].priority == 9);
        REQUIRE(candidates[0].metadata.at("script") == "tsc -p .");
    }

    SECTION("Runner commands and scripts at the subcommand position") {
        auto candidates = resolvePackageScripts(fixture.context("yarn t"), fixture.services);
        REQUIRE(texts(candidates) == std::vector<std::string>{"test"});
    }

    SECTION("Nothing for other positions") {
        REQUIRE(resolvePackageScripts(fixture.context("npm install left"), fixture.services).empty());
    }
}

TEST_CASE("Container resolver", "[resolvers][docker]") {
    ResolverFixture fixture;

    REQUIRE(texts(resolveContainers(fixture.context("docker ru"), fixture.services)) == std::vector<std::string>{"run"});

    fixture.runner.runReturnValue = ProcessRunnerMock::exited(0, "web\nworker\ndb\n");
    auto names = resolveContainers(fixture.context("podman exec w"), fixture.services);
    REQUIRE(texts(names) == std::vector<std::string>{"web", "worker"});
    auto& call = std::get<ProcessRunnerMock::RunCall>(fixture.runner.calls.at(0));
    REQUIRE(call.argv == std::vector<std::string>{"podman", "ps", "--format", "{{.Names}}"});

    fixture.runner.runReturnValue = ProcessRunnerMock::exited(0, "nginx:latest\n<none>:<none>\n");
    REQUIRE(texts(resolveContainers(fixture.context("docker run "), fixture.services)) == std::vector<std::string>{"nginx:latest"});
}

TEST_CASE("Process resolver", "[resolvers][kill]") {
    ResolverFixture fixture;

    REQUIRE(parseProcessList("  PID COMMAND\n    1 systemd\n   42 bash\n") ==
            std::vector<std::pair<std::string, std::string>>{{"1", "systemd"}, {"42", "bash"}});

    fixture.runner.runReturnValue = ProcessRunnerMock::exited(0, "  PID COMMAND\n    1 systemd\n   42 bash\n  420 zsh\n");
    auto candidates = resolveProcesses(fixture.context("kill 4"), fixture.services);
    REQUIRE(texts(candidates) == std::vector<std::string>{"42", "420"});
    REQUIRE(candidates[0].description == "bash");
    REQUIRE(candidates[0].priority == 7);

    SECTION("At most twenty processes") {
        std::string output = "PID COMMAND\n";
        for (int pid = 100; pid < 150; ++pid) {
            output += std::to_string(pid) + " worker\n";
        }
        fixture.runner.runReturnValue = ProcessRunnerMock::exited(0, output);
        REQUIRE(resolveProcesses(fixture.context("kill "), fixture.services).size() == 20);
    }
}

TEST_CASE("Host parsers", "[resolvers][ssh]") {
    REQUIRE(parseKnownHosts("github.com,140.82.1.1 ssh-rsa AAA\n"
                            "|1|hash= ssh-rsa AAA\n"
                            "[gitlab.com]:2222 ssh-ed25519 AAA\n"
                            "@cert-authority *.corp ssh-rsa AAA\n"
                            "# comment\n") ==
            std::vector<std::string>{"github.com", "140.82.1.1"});

    REQUIRE(parseSshConfigHosts("Host work\n"
                                "  HostName work.example.com\n"
                                "Host *.corp !bad alias2\n"
                                "Host=eq\n") ==
            std::vector<std::string>{"work", "alias2", "eq"});

    REQUIRE(parseEtcHosts("127.0.0.1 localhost\n"
                          "::1 localhost ip6-localhost # loopback\n"
                          "# 10.0.0.1 ignored\n") ==
            std::vector<std::string>{"localhost", "ip6-localhost"});
}

TEST_CASE("Host resolver", "[resolvers][ssh]") {
    ResolverFixture fixture;
    fixture.home.writeFile(".ssh/config", "Host work\n");
    fixture.home.writeFile(".ssh/known_hosts", "work ssh-rsa AAA\nwebby ssh-rsa AAA\n");
    fixture.home.writeFile("etc-hosts", "127.0.0.1 wolf\n");

    SECTION("All sources, best source first, duplicates removed") {
        auto candidates = resolveHosts(fixture.context("ssh w"), fixture.services);
        REQUIRE(texts(candidates) == std::vector<std::string>{"work", "webby", "wolf"});
        REQUIRE(candidates[0].priority == 9);
        REQUIRE(candidates[1].priority == 8);
        REQUIRE(candidates[2].priority == 7);
        REQUIRE(candidates[0].category == CompletionCategory::Hostname);
    }

    SECTION("User prefix is preserved") {
        auto candidates = resolveHosts(fixture.context("ssh deploy@wo"), fixture.services);
        REQUIRE(texts(candidates) == std::vector<std::string>{"deploy@work", "deploy@wolf"});
    }

    SECTION("Remote paths are not host names") {
        REQUIRE(resolveHosts(fixture.context("scp work:/tm"), fixture.services).empty());
    }
}

TEST_CASE("CommandResolverRegistry lookup", "[resolvers]") {
    auto registry = CommandResolverRegistry::withDefaults();

    REQUIRE(registry.find("git") != nullptr);
    REQUIRE(registry.find("/usr/bin/git") != nullptr);
    REQUIRE(registry.find("pnpm") != nullptr);
    REQUIRE(registry.find("cd")->replacesFileCompletions);
    REQUIRE_FALSE(registry.find("ssh")->replacesFileCompletions);
    REQUIRE(registry.find("cat") == nullptr);

    registry.remove("git");
    REQUIRE(registry.find("git") == nullptr);

    registry.add("make", CommandResolver{[](const CompletionContext&, const BackendServices&) {
        return std::vector<CompletionCandidate>{makeCandidate("all", "target", CompletionCategory::Argument, 8)};
    }, nullptr, false});
    REQUIRE(registry.find("make") != nullptr);
}

TEST_CASE("Help output parser", "[resolvers][help]") {
    auto options = parseHelpOptions(
        "Usage: tool [OPTION]...\n"
        "  -a, --all        show all entries\n"
        "  --color=WHEN     colorize   output\n"
        "  -v\n"
        "  --all            listed twice\n");

    using Option = std::pair<std::string, std::string>;
    REQUIRE(options == std::vector<Option>{
        {"-a", "show all entries"},
        {"--all", "show all entries"},
        {"--color", "colorize output"},
        {"-v", ""}
    });
}
