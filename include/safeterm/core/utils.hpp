#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "safeterm/core/error.hpp"

namespace safeterm::utils {

auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;

/// Splits a command line into words using POSIX-shell-like quoting:
/// whitespace separates words, single quotes are literal, double quotes
/// honour `\"`, `\\` and `\$` escapes, and a backslash outside quotes
/// escapes the next character. `''` yields an empty word.
///
/// Fails with ErrorCode::ParseError on an unterminated quote or a
/// trailing backslash.
auto shell_split(std::string_view line) -> Result<std::vector<std::string>>;

} // namespace safeterm::utils
