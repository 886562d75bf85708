#include <shellsense/command_line.h>

#include <algorithm>

namespace shellsense {

namespace {

bool isBlank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // namespace

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    bool escaped = false;
    bool inWord = false;
    char quote = '\0';

    for (char c : text) {
        if (escaped) {
            current += c;
            escaped = false;
            continue;
        }

        if (quote != '\0') {
            current += c;
            if (c == quote) {
                quote = '\0';
            }
            continue;
        }

        if (c == '\\') {
            current += c;
            escaped = true;
            inWord = true;
        } else if (c == '"' || c == '\'') {
            current += c;
            quote = c;
            inWord = true;
        } else if (isBlank(c)) {
            if (inWord) {
                words.push_back(std::move(current));
                current.clear();
                inWord = false;
            }
        } else {
            current += c;
            inWord = true;
        }
    }

    if (inWord) {
        words.push_back(std::move(current));
    } else if (!text.empty() && isBlank(text.back())) {
        // Cursor sits after a separator: a new, still empty word starts here
        words.emplace_back();
    }

    return words;
}

std::string unquote(std::string_view word) {
    std::string result;
    result.reserve(word.size());
    char quote = '\0';

    for (size_t i = 0; i < word.size(); ++i) {
        char c = word[i];
        if (quote != '\0') {
            // Same rule as tokenize(): a quoted span has no escapes
            if (c == quote) {
                quote = '\0';
            } else {
                result += c;
            }
        } else if (c == '\\') {
            if (i + 1 < word.size()) {
                result += word[++i];
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else {
            result += c;
        }
    }

    return result;
}

std::string commandBaseName(std::string_view commandWord) {
    std::string name = unquote(commandWord);
    if (auto slash = name.find_last_of('/'); slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    return name;
}

CompletionContext classify(std::string_view line, size_t cursor, std::string workingDirectory) {
    CompletionContext context;
    context.line = std::string(line);
    context.cursor = std::min(cursor, line.size());
    context.workingDirectory = std::move(workingDirectory);

    std::vector<std::string> words = tokenize(line.substr(0, context.cursor));
    if (!words.empty()) {
        context.currentWord = std::move(words.back());
        words.pop_back();
    }
    context.previousWords = std::move(words);

    if (!context.previousWords.empty()) {
        context.commandName = context.previousWords.front();
    }

    const std::string& word = context.currentWord;
    if (startsWith(word, "$")) {
        context.slot = CompletionSlot::Variable;
    } else if (startsWith(word, "-")) {
        context.slot = CompletionSlot::Option;
    } else if (word.find('/') != std::string::npos || startsWith(word, "~")) {
        context.slot = CompletionSlot::Path;
    } else if (context.previousWords.empty()) {
        context.slot = CompletionSlot::Command;
    } else {
        context.slot = CompletionSlot::Argument;
    }

    return context;
}

} // namespace shellsense
