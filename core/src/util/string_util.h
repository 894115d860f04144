#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace xmlnav::util {

/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not allocate.
std::string_view trim_ws(std::string_view s);
/// Collapses every whitespace run to a single space and trims both ends.
std::string compact_whitespace(std::string_view text);
/// Cuts `text` to at most `max_chars` UTF-8 code points, appending "..." when cut.
/// MUST never split a multi-byte sequence.
std::string truncate_chars(std::string_view text, size_t max_chars);
/// Validates UTF-8 encoding (no overlongs, no surrogates, max U+10FFFF).
bool is_valid_utf8(std::string_view text);

}  // namespace xmlnav::util
