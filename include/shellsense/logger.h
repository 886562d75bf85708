#pragma once

#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>

namespace shellsense {

enum class LogLevel {
    Quiet,
    Error,
    Warning,
    Info,
    Debug
};

std::optional<LogLevel> logLevelFromString(std::string_view name);
std::string_view logLevelName(LogLevel level);

/**
 * Leveled logger writing "[level] message" lines to a stdio stream.
 *
 * Components receive a Logger reference at construction; verbosity is part of
 * the configuration snapshot and is never looked up from the environment.
 * Subclasses may override write() to redirect output (tests record it).
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Warning, std::FILE* stream = stderr);
    virtual ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel getLevel() const { return this->level; }
    void setLevel(LogLevel newLevel) { this->level = newLevel; }

    bool isEnabled(LogLevel messageLevel) const {
        return messageLevel != LogLevel::Quiet && messageLevel <= this->level;
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        this->log(LogLevel::Error, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        this->log(LogLevel::Warning, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        this->log(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        this->log(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

protected:
    virtual void write(LogLevel messageLevel, const std::string& message);

private:
    template <typename... Args>
    void log(LogLevel messageLevel, fmt::format_string<Args...> format, Args&&... args) {
        if (!this->isEnabled(messageLevel)) {
            return;
        }
        this->write(messageLevel, fmt::format(format, std::forward<Args>(args)...));
    }

    LogLevel level;
    std::FILE* stream;
};

} // namespace shellsense
