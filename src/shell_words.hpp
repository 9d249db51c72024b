#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cmdrun::shell_words {

// Split a command line into words following POSIX shell quoting rules.
// Throws Error(ErrorKind::ArgumentParse) on an unterminated quote.
[[nodiscard]] std::vector<std::string> split(std::string_view text);

// Quote a single word so that split() returns it unchanged.
[[nodiscard]] std::string quote(std::string_view word);

// Quote and space-join words; inverse of split().
[[nodiscard]] std::string join(const std::vector<std::string>& words);

} // namespace cmdrun::shell_words
