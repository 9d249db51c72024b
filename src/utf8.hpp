#pragma once

#include <string>
#include <string_view>

namespace cmdrun {

// Strict UTF-8 validation (rejects overlongs, surrogates and > U+10FFFF).
[[nodiscard]] bool is_valid_utf8(std::string_view text);

// Appends the UTF-8 encoding of a scalar value; returns false for
// surrogates and values above U+10FFFF.
bool append_utf8(std::string& out, char32_t code_point);

} // namespace cmdrun
