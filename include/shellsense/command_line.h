#pragma once

#include <shellsense/completion_types.h>
#include <string>
#include <string_view>
#include <vector>

namespace shellsense {

/**
 * Split a command line into raw words.
 *
 * Quote characters and escape backslashes stay in the emitted words so the
 * original text can be reproduced; unquote() removes them. Backslash escapes
 * apply outside quotes only: a quoted span runs to the next matching quote
 * character, backslashes included. A line ending in
 * unescaped whitespace yields one trailing empty word. Unterminated quotes are
 * accepted and end with the line.
 */
std::vector<std::string> tokenize(std::string_view text);

/**
 * Shell value of a raw word: quotes removed, backslash escapes outside quotes
 * resolved. Follows the quoting rule of tokenize().
 */
std::string unquote(std::string_view word);

/**
 * Program name of a command word: unquoted, directories stripped
 */
std::string commandBaseName(std::string_view commandWord);

/**
 * Classify the word under the cursor.
 * @param line full input line
 * @param cursor byte offset of the cursor, clamped to the line length
 * @param workingDirectory directory the request is made from
 */
CompletionContext classify(std::string_view line, size_t cursor, std::string workingDirectory = ".");

} // namespace shellsense
