#include "utils/utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <string>

namespace markup {

namespace {

const unsigned long kReplacementChar = 0xFFFD;
const unsigned long kMaxCodepoint = 0x10FFFF;

bool isContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

bool isAsciiSpace(char c) {
  switch (c) {
    case ' ':
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
    case '\x1c':
    case '\x1d':
    case '\x1e':
    case '\x1f':
      return true;
    default:
      return false;
  }
}

// Trim whitespace from both ends of a string and return the trimmed copy.
std::string trim_copy(const std::string& str) {
  std::string::size_type begin = 0;
  while (begin < str.size() && isAsciiSpace(str[begin])) {
    ++begin;
  }
  std::string::size_type end = str.size();
  while (end > begin && isAsciiSpace(str[end - 1])) {
    --end;
  }
  return str.substr(begin, end - begin);
}

std::vector<std::string> splitWhitespace(const std::string& str,
                                         long maxsplit) {
  std::vector<std::string> parts;
  std::string::size_type idx = 0;
  long splits = 0;
  while (maxsplit < 0 || splits < maxsplit) {
    while (idx < str.size() && isAsciiSpace(str[idx])) {
      ++idx;
    }
    if (idx >= str.size()) {
      break;
    }
    std::string::size_type start = idx;
    while (idx < str.size() && !isAsciiSpace(str[idx])) {
      ++idx;
    }
    parts.push_back(str.substr(start, idx - start));
    ++splits;
  }
  while (idx < str.size() && isAsciiSpace(str[idx])) {
    ++idx;
  }
  if (idx < str.size()) {
    parts.push_back(str.substr(idx));
  }
  return parts;
}

std::vector<std::string> rsplitWhitespace(const std::string& str,
                                          long maxsplit) {
  std::vector<std::string> parts;
  std::string::size_type end = str.size();
  long splits = 0;
  while (maxsplit < 0 || splits < maxsplit) {
    while (end > 0 && isAsciiSpace(str[end - 1])) {
      --end;
    }
    if (end == 0) {
      break;
    }
    std::string::size_type start = end;
    while (start > 0 && !isAsciiSpace(str[start - 1])) {
      --start;
    }
    parts.push_back(str.substr(start, end - start));
    end = start;
    ++splits;
  }
  while (end > 0 && isAsciiSpace(str[end - 1])) {
    --end;
  }
  if (end > 0) {
    parts.push_back(str.substr(0, end));
  }
  std::reverse(parts.begin(), parts.end());
  return parts;
}

std::string joinWithSpace(const std::vector<std::string>& items) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    out.append(items[i]);
  }
  return out;
}

std::string asciiLower(const std::string& str) {
  std::string out(str);
  for (size_t i = 0; i < out.size(); ++i) {
    if (out[i] >= 'A' && out[i] <= 'Z') {
      out[i] = static_cast<char>(out[i] - 'A' + 'a');
    }
  }
  return out;
}

std::string asciiUpper(const std::string& str) {
  std::string out(str);
  for (size_t i = 0; i < out.size(); ++i) {
    if (out[i] >= 'a' && out[i] <= 'z') {
      out[i] = static_cast<char>(out[i] - 'a' + 'A');
    }
  }
  return out;
}

bool safeStrtoll(const std::string& s, long long& out, int base) {
  if (s.empty()) {
    return false;
  }
  // strtoll would silently accept these.
  if (s[0] == '+' || s[0] == '-' || isAsciiSpace(s[0])) {
    return false;
  }
  errno = 0;
  char* endptr = NULL;
  long long num = std::strtoll(s.c_str(), &endptr, base);
  // Check for conversion errors: range error, no conversion, or trailing chars
  if (errno == ERANGE || endptr == s.c_str() ||
      (endptr != NULL && *endptr != '\0')) {
    return false;
  }
  out = num;
  return true;
}

void appendUtf8(std::string& out, unsigned long codepoint) {
  if (codepoint > kMaxCodepoint ||
      (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
    codepoint = kReplacementChar;
  }
  if (codepoint < 0x80) {
    out.push_back(static_cast<char>(codepoint));
  } else if (codepoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else if (codepoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
  }
}

std::size_t utf8Length(const std::string& str) {
  std::size_t count = 0;
  for (size_t i = 0; i < str.size(); ++i) {
    if (!isContinuationByte(str[i])) {
      ++count;
    }
  }
  return count;
}

std::string utf8Truncate(const std::string& str, std::size_t count) {
  std::size_t seen = 0;
  for (size_t i = 0; i < str.size(); ++i) {
    if (!isContinuationByte(str[i])) {
      if (seen == count) {
        return str.substr(0, i);
      }
      ++seen;
    }
  }
  return str;
}

}  // namespace markup
