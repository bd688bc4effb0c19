#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace markup {

// Whitespace as understood by the text operations: space, tab, LF, VT, FF,
// CR and the ASCII file/group/record/unit separators.
bool isAsciiSpace(char c);

// Trim whitespace from both ends of a string.
// Returns a copy with the trimmed content.
std::string trim_copy(const std::string& str);

// Split on runs of whitespace, dropping empty fragments. After `maxsplit`
// splits (no limit if negative) the rest is kept as one fragment, with its
// leading whitespace removed.
std::vector<std::string> splitWhitespace(const std::string& str,
                                         long maxsplit = -1);

// Like splitWhitespace(), splitting from the right.
std::vector<std::string> rsplitWhitespace(const std::string& str,
                                          long maxsplit = -1);

// Join with a single space between items.
std::string joinWithSpace(const std::vector<std::string>& items);

std::string asciiLower(const std::string& str);
std::string asciiUpper(const std::string& str);

// Safely parse a string to a long long integer using strtoll with error
// checking. Returns true on success with value stored in `out`, false on
// failure (empty string, sign or whitespace prefix, invalid characters, or
// out of range).
bool safeStrtoll(const std::string& s, long long& out, int base = 10);

// Append the UTF-8 encoding of `codepoint`. Surrogates and values above
// U+10FFFF are encoded as U+FFFD.
void appendUtf8(std::string& out, unsigned long codepoint);

// Number of code points in a UTF-8 string (counts non-continuation bytes).
std::size_t utf8Length(const std::string& str);

// Keep at most `count` code points.
std::string utf8Truncate(const std::string& str, std::size_t count);

}  // namespace markup
