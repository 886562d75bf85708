#include <shellsense/logger.h>

namespace shellsense {

std::optional<LogLevel> logLevelFromString(std::string_view name) {
    if (name == "quiet" || name == "off") return LogLevel::Quiet;
    if (name == "error") return LogLevel::Error;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "info") return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    return std::nullopt;
}

std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Quiet: return "quiet";
        case LogLevel::Error: return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
    }
    return "warning";
}

Logger::Logger(LogLevel level, std::FILE* stream)
    : level(level)
    , stream(stream)
{
}

void Logger::write(LogLevel messageLevel, const std::string& message) {
    fmt::print(this->stream, "[{}] {}\n", logLevelName(messageLevel), message);
}

} // namespace shellsense
