#include <shellsense/completion/completion_manager.h>
#include <shellsense/config.h>
#include <shellsense/filesystem/file_system_manager.h>
#include <shellsense/history/history_json.h>
#include <shellsense/logger.h>
#include <shellsense/process_runner.h>
#include <shellsense/shell_environment.h>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <fmt/core.h>

using namespace shellsense;

void printUsage(std::string_view programName) {
    fmt::print("Usage: {} [options] <line> [cursor]\n", programName);
    fmt::print("Options:\n");
    fmt::print("  -s, --shell <path>       Shell to complete for (default: $SHELL)\n");
    fmt::print("  -c, --config <file>      JSON configuration file\n");
    fmt::print("  -C, --cwd <dir>          Working directory (default: current)\n");
    fmt::print("      --fuzzy              Rank candidates with the fuzzy ranker\n");
    fmt::print("      --no-fuzzy           Sort candidates by priority only\n");
    fmt::print("  -v, --verbose            Debug logging\n");
    fmt::print("      --history <query>    Search merged history instead of completing\n");
    fmt::print("      --add <command>      Append a command to the shellsense history\n");
    fmt::print("      --stats              Print history statistics as JSON\n");
    fmt::print("      --export <format>    Print history as json, plain, bash or zsh\n");
    fmt::print("  -h, --help               Show this help message\n");
    fmt::print("\nExamples:\n");
    fmt::print("  {} 'git ch'              # Complete a git subcommand\n", programName);
    fmt::print("  {} -C /tmp 'ls sr' 5     # Complete a path relative to /tmp\n", programName);
    fmt::print("  {} --history docker      # Recent docker commands\n", programName);
}

int main(int argc, char* argv[])
{
    std::optional<std::string> shellPath;
    std::optional<std::filesystem::path> configPath;
    std::optional<std::string> workingDirectory;
    std::optional<bool> fuzzy;
    bool verbose = false;
    std::optional<std::string> historyQuery;
    std::optional<std::string> commandToAdd;
    std::optional<std::string> exportFormat;
    bool printStats = false;
    std::optional<std::string> line;
    std::optional<size_t> cursor;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        auto requireValue = [&](const char* option) -> const char* {
            if (i + 1 < argc) {
                return argv[++i];
            }
            fmt::print(stderr, "Error: {} requires an argument\n", option);
            return nullptr;
        };

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--shell") == 0) {
            const char* value = requireValue("--shell");
            if (!value) return 1;
            shellPath = value;
        } else if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            const char* value = requireValue("--config");
            if (!value) return 1;
            configPath = value;
        } else if (strcmp(argv[i], "-C") == 0 || strcmp(argv[i], "--cwd") == 0) {
            const char* value = requireValue("--cwd");
            if (!value) return 1;
            workingDirectory = value;
        } else if (strcmp(argv[i], "--fuzzy") == 0) {
            fuzzy = true;
        } else if (strcmp(argv[i], "--no-fuzzy") == 0) {
            fuzzy = false;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "--history") == 0) {
            const char* value = requireValue("--history");
            if (!value) return 1;
            historyQuery = value;
        } else if (strcmp(argv[i], "--add") == 0) {
            const char* value = requireValue("--add");
            if (!value) return 1;
            commandToAdd = value;
        } else if (strcmp(argv[i], "--export") == 0) {
            const char* value = requireValue("--export");
            if (!value) return 1;
            exportFormat = value;
        } else if (strcmp(argv[i], "--stats") == 0) {
            printStats = true;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            fmt::print(stderr, "Error: Unknown option '{}'\n", argv[i]);
            printUsage(argv[0]);
            return 1;
        } else if (!line) {
            line = argv[i];
        } else if (!cursor) {
            char* end = nullptr;
            unsigned long value = std::strtoul(argv[i], &end, 10);
            if (end == argv[i] || *end != '\0') {
                fmt::print(stderr, "Error: Invalid cursor position '{}'\n", argv[i]);
                return 1;
            }
            cursor = static_cast<size_t>(value);
        } else {
            fmt::print(stderr, "Error: Unexpected argument '{}'\n", argv[i]);
            return 1;
        }
    }

    bool historyCommand = historyQuery || commandToAdd || exportFormat || printStats;
    if (!line && !historyCommand) {
        printUsage(argv[0]);
        return 1;
    }

    Logger logger(verbose ? LogLevel::Debug : LogLevel::Warning);

    // Configuration: explicit file, else the default one if it exists
    Config config;
    std::filesystem::path configFile = configPath.value_or(FileSystemManager().getDefaultConfigPath());
    std::error_code ec;
    if (configPath || std::filesystem::exists(configFile, ec)) {
        auto loaded = loadConfigFile(configFile);
        if (!loaded.parsed) {
            logger.error("Cannot load configuration '{}'", configFile.string());
            if (configPath) {
                return 1;
            }
        } else {
            config = loaded.config;
        }
        for (const auto& warning : loaded.warnings) {
            logger.warn("Config: {}", warning);
        }
    }
    if (!verbose) {
        logger.setLevel(config.logLevel);
    }
    if (shellPath) {
        config.shellPath = *shellPath;
    }
    if (fuzzy) {
        config.completion.fuzzySearch = *fuzzy;
    }

    if (!workingDirectory) {
        auto current = std::filesystem::current_path(ec);
        workingDirectory = ec ? std::string(".") : current.string();
    }

    ShellEnvironment environment = ShellEnvironment::capture();
    PosixProcessRunner runner(environment);
    auto manager = CompletionManager::create(config, environment, runner, logger);
    HistoryManager* history = manager->getHistoryManager();

    if (historyCommand && !history) {
        fmt::print(stderr, "Error: history is disabled in the configuration\n");
        return 1;
    }

    if (commandToAdd) {
        HistoryEntry entry;
        entry.command = *commandToAdd;
        entry.cwd = *workingDirectory;
        if (!history->add(entry)) {
            fmt::print(stderr, "Not added: '{}'\n", *commandToAdd);
        }
        if (!history->flush()) {
            return 1;
        }
    }
    if (historyQuery) {
        for (const auto& entry : history->search(*historyQuery)) {
            fmt::print("{}\t{}\n", entry.source, entry.command);
        }
    }
    if (printStats) {
        json document = json::object();
        for (const auto& [name, stats] : history->getStats()) {
            document[name] = stats;
        }
        fmt::print("{}\n", dumpJson(document, 2));
    }
    if (exportFormat) {
        auto exported = history->exportTo(*exportFormat);
        if (!exported) {
            fmt::print(stderr, "Error: Unknown export format '{}'\n", *exportFormat);
            return 1;
        }
        fmt::print("{}\n", *exported);
    }

    if (line) {
        size_t position = cursor.value_or(line->size());
        for (const auto& candidate : manager->complete(*line, position, *workingDirectory)) {
            fmt::print("{}\t{}\t{}\n", candidate.text, categoryName(candidate.category), candidate.description);
        }
    }

    if (history && !history->flush()) {
        return 1;
    }
    return 0;
}
