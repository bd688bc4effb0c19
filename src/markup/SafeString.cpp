#include "markup/SafeString.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "markup/Formatter.hpp"
#include "markup/entities.hpp"
#include "markup/escape.hpp"
#include "utils/utils.hpp"

namespace markup {

namespace {

enum StripSide { STRIP_LEFT = 1, STRIP_RIGHT = 2, STRIP_BOTH = 3 };

bool isUpper(char c) {
  return c >= 'A' && c <= 'Z';
}

bool isLower(char c) {
  return c >= 'a' && c <= 'z';
}

char toUpper(char c) {
  return isLower(c) ? static_cast<char>(c - 'a' + 'A') : c;
}

char toLower(char c) {
  return isUpper(c) ? static_cast<char>(c - 'A' + 'a') : c;
}

// Split UTF-8 text into one string per code point.
std::vector<std::string> codepoints(const std::string& str) {
  std::vector<std::string> points;
  std::size_t idx = 0;
  while (idx < str.size()) {
    std::size_t len = 1;
    while (idx + len < str.size() &&
           (static_cast<unsigned char>(str[idx + len]) & 0xC0) == 0x80) {
      ++len;
    }
    points.push_back(str.substr(idx, len));
    idx += len;
  }
  return points;
}

std::string stripWhitespace(const std::string& str, int side) {
  std::string::size_type begin = 0;
  std::string::size_type end = str.size();
  if (side & STRIP_LEFT) {
    while (begin < end && isAsciiSpace(str[begin])) {
      ++begin;
    }
  }
  if (side & STRIP_RIGHT) {
    while (end > begin && isAsciiSpace(str[end - 1])) {
      --end;
    }
  }
  return str.substr(begin, end - begin);
}

std::string stripChars(const std::string& str, const std::string& chars,
                       int side) {
  std::vector<std::string> strip_set = codepoints(chars);
  std::vector<std::string> points = codepoints(str);
  std::size_t begin = 0;
  std::size_t end = points.size();
  if (side & STRIP_LEFT) {
    while (begin < end && std::find(strip_set.begin(), strip_set.end(),
                                    points[begin]) != strip_set.end()) {
      ++begin;
    }
  }
  if (side & STRIP_RIGHT) {
    while (end > begin && std::find(strip_set.begin(), strip_set.end(),
                                    points[end - 1]) != strip_set.end()) {
      --end;
    }
  }
  std::string out;
  for (std::size_t i = begin; i < end; ++i) {
    out.append(points[i]);
  }
  return out;
}

std::string escapedSeparator(const Value& separator) {
  std::string sep = escape(separator).str();
  if (sep.empty()) {
    throw std::invalid_argument("empty separator");
  }
  return sep;
}

bool hasPrefix(const std::string& str, const std::string& prefix) {
  return prefix.size() <= str.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

bool hasSuffix(const std::string& str, const std::string& suffix) {
  return suffix.size() <= str.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Length of the line break starting at `idx`, or 0 if there is none.
std::size_t lineBreakLength(const std::string& str, std::size_t idx) {
  const unsigned char c = static_cast<unsigned char>(str[idx]);
  switch (c) {
    case '\r':
      return (idx + 1 < str.size() && str[idx + 1] == '\n') ? 2 : 1;
    case '\n':
    case '\v':
    case '\f':
    case 0x1c:
    case 0x1d:
    case 0x1e:
      return 1;
    case 0xC2:  // U+0085 NEXT LINE
      if (idx + 1 < str.size() &&
          static_cast<unsigned char>(str[idx + 1]) == 0x85) {
        return 2;
      }
      return 0;
    case 0xE2:  // U+2028 LINE SEPARATOR, U+2029 PARAGRAPH SEPARATOR
      if (idx + 2 < str.size() &&
          static_cast<unsigned char>(str[idx + 1]) == 0x80 &&
          (static_cast<unsigned char>(str[idx + 2]) == 0xA8 ||
           static_cast<unsigned char>(str[idx + 2]) == 0xA9)) {
        return 3;
      }
      return 0;
    default:
      return 0;
  }
}

std::string fillCharacter(const Value& fill) {
  std::string escaped = escape(fill).str();
  if (utf8Length(escaped) != 1) {
    throw std::invalid_argument(
        "The fill character must be exactly one character long");
  }
  return escaped;
}

std::string repeat(const std::string& str, long count) {
  std::string out;
  for (long i = 0; i < count; ++i) {
    out.append(str);
  }
  return out;
}

// Clamp a possibly negative index into [0, length].
long clampIndex(long index, long length) {
  if (index < 0) {
    index += length;
    if (index < 0) {
      return 0;
    }
  }
  return index > length ? length : index;
}

std::vector<SafeString> wrapAll(const std::vector<std::string>& parts) {
  std::vector<SafeString> out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    out.push_back(SafeString(parts[i]));
  }
  return out;
}

}  // namespace

SafeString::SafeString() {}

SafeString::SafeString(const std::string& markup) : payload_(markup) {}

SafeString::SafeString(const SafeString& other) : payload_(other.payload_) {}

SafeString& SafeString::operator=(const SafeString& other) {
  if (this != &other) {
    payload_ = other.payload_;
  }
  return *this;
}

SafeString::~SafeString() {}

const std::string& SafeString::str() const {
  return payload_;
}

std::size_t SafeString::size() const {
  return payload_.size();
}

bool SafeString::empty() const {
  return payload_.empty();
}

SafeString SafeString::join(const std::vector<Value>& items) const {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out.append(payload_);
    }
    out.append(escape(items[i]).str());
  }
  return SafeString(out);
}

SafeString SafeString::format(const FormatArgs& args) const {
  return SafeString(formatBraces(payload_, args));
}

SafeString SafeString::interpolate(const FormatArgs& args) const {
  return SafeString(formatPercent(payload_, args));
}

SafeString SafeString::lower() const {
  return SafeString(asciiLower(payload_));
}

SafeString SafeString::upper() const {
  return SafeString(asciiUpper(payload_));
}

SafeString SafeString::capitalize() const {
  std::string out = asciiLower(payload_);
  if (!out.empty()) {
    out[0] = toUpper(out[0]);
  }
  return SafeString(out);
}

SafeString SafeString::title() const {
  std::string out(payload_);
  bool previousCased = false;
  for (std::size_t i = 0; i < out.size(); ++i) {
    char c = out[i];
    if (isUpper(c) || isLower(c)) {
      out[i] = previousCased ? toLower(c) : toUpper(c);
      previousCased = true;
    } else {
      previousCased = false;
    }
  }
  return SafeString(out);
}

SafeString SafeString::swapcase() const {
  std::string out(payload_);
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = isUpper(out[i]) ? toLower(out[i]) : toUpper(out[i]);
  }
  return SafeString(out);
}

SafeString SafeString::casefold() const {
  return lower();
}

bool SafeString::equalsIgnoreCase(const Value& other) const {
  return asciiLower(payload_) == asciiLower(escape(other).str());
}

SafeString SafeString::strip() const {
  return SafeString(stripWhitespace(payload_, STRIP_BOTH));
}

SafeString SafeString::strip(const Value& chars) const {
  if (chars.isNone()) {
    return strip();
  }
  return SafeString(stripChars(payload_, escape(chars).str(), STRIP_BOTH));
}

SafeString SafeString::lstrip() const {
  return SafeString(stripWhitespace(payload_, STRIP_LEFT));
}

SafeString SafeString::lstrip(const Value& chars) const {
  if (chars.isNone()) {
    return lstrip();
  }
  return SafeString(stripChars(payload_, escape(chars).str(), STRIP_LEFT));
}

SafeString SafeString::rstrip() const {
  return SafeString(stripWhitespace(payload_, STRIP_RIGHT));
}

SafeString SafeString::rstrip(const Value& chars) const {
  if (chars.isNone()) {
    return rstrip();
  }
  return SafeString(stripChars(payload_, escape(chars).str(), STRIP_RIGHT));
}

SafeString SafeString::removeprefix(const Value& prefix) const {
  std::string escaped = escape(prefix).str();
  if (hasPrefix(payload_, escaped)) {
    return SafeString(payload_.substr(escaped.size()));
  }
  return *this;
}

SafeString SafeString::removesuffix(const Value& suffix) const {
  std::string escaped = escape(suffix).str();
  if (hasSuffix(payload_, escaped)) {
    return SafeString(payload_.substr(0, payload_.size() - escaped.size()));
  }
  return *this;
}

bool SafeString::startswith(const Value& prefix) const {
  return hasPrefix(payload_, escape(prefix).str());
}

bool SafeString::endswith(const Value& suffix) const {
  return hasSuffix(payload_, escape(suffix).str());
}

bool SafeString::contains(const Value& needle) const {
  return payload_.find(escape(needle).str()) != std::string::npos;
}

SafeString SafeString::replace(const Value& old, const Value& replacement,
                               long count) const {
  const std::string from = escape(old).str();
  const std::string to = escape(replacement).str();
  std::string out;
  long done = 0;

  if (from.empty()) {
    std::vector<std::string> points = codepoints(payload_);
    for (std::size_t i = 0; i < points.size(); ++i) {
      if (count < 0 || done < count) {
        out.append(to);
        ++done;
      }
      out.append(points[i]);
    }
    if (count < 0 || done < count) {
      out.append(to);
    }
    return SafeString(out);
  }

  std::size_t start = 0;
  while (count < 0 || done < count) {
    std::size_t pos = payload_.find(from, start);
    if (pos == std::string::npos) {
      break;
    }
    out.append(payload_, start, pos - start);
    out.append(to);
    start = pos + from.size();
    ++done;
  }
  out.append(payload_, start, std::string::npos);
  return SafeString(out);
}

std::vector<SafeString> SafeString::split() const {
  return wrapAll(splitWhitespace(payload_));
}

std::vector<SafeString> SafeString::split(const Value& separator,
                                          long maxsplit) const {
  if (separator.isNone()) {
    return wrapAll(splitWhitespace(payload_, maxsplit));
  }
  const std::string sep = escapedSeparator(separator);
  std::vector<SafeString> parts;
  std::size_t start = 0;
  long splits = 0;
  while (maxsplit < 0 || splits < maxsplit) {
    std::size_t pos = payload_.find(sep, start);
    if (pos == std::string::npos) {
      break;
    }
    parts.push_back(SafeString(payload_.substr(start, pos - start)));
    start = pos + sep.size();
    ++splits;
  }
  parts.push_back(SafeString(payload_.substr(start)));
  return parts;
}

std::vector<SafeString> SafeString::rsplit(const Value& separator,
                                           long maxsplit) const {
  if (separator.isNone()) {
    return wrapAll(rsplitWhitespace(payload_, maxsplit));
  }
  const std::string sep = escapedSeparator(separator);
  std::vector<SafeString> parts;
  std::size_t end = payload_.size();
  long splits = 0;
  while ((maxsplit < 0 || splits < maxsplit) && end >= sep.size()) {
    std::size_t pos = payload_.rfind(sep, end - sep.size());
    if (pos == std::string::npos) {
      break;
    }
    std::size_t tail = pos + sep.size();
    parts.push_back(SafeString(payload_.substr(tail, end - tail)));
    end = pos;
    ++splits;
  }
  parts.push_back(SafeString(payload_.substr(0, end)));
  std::reverse(parts.begin(), parts.end());
  return parts;
}

std::vector<SafeString> SafeString::splitlines(bool keepends) const {
  std::vector<SafeString> lines;
  std::size_t start = 0;
  std::size_t idx = 0;
  while (idx < payload_.size()) {
    std::size_t eol = lineBreakLength(payload_, idx);
    if (eol == 0) {
      ++idx;
      continue;
    }
    std::size_t end = keepends ? idx + eol : idx;
    lines.push_back(SafeString(payload_.substr(start, end - start)));
    idx += eol;
    start = idx;
  }
  if (start < payload_.size()) {
    lines.push_back(SafeString(payload_.substr(start)));
  }
  return lines;
}

Partition SafeString::partition(const Value& separator) const {
  const std::string sep = escapedSeparator(separator);
  Partition result;
  std::size_t pos = payload_.find(sep);
  if (pos == std::string::npos) {
    result.head = *this;
    return result;
  }
  result.head = SafeString(payload_.substr(0, pos));
  result.separator = SafeString(sep);
  result.tail = SafeString(payload_.substr(pos + sep.size()));
  return result;
}

Partition SafeString::rpartition(const Value& separator) const {
  const std::string sep = escapedSeparator(separator);
  Partition result;
  std::size_t pos = payload_.rfind(sep);
  if (pos == std::string::npos) {
    result.tail = *this;
    return result;
  }
  result.head = SafeString(payload_.substr(0, pos));
  result.separator = SafeString(sep);
  result.tail = SafeString(payload_.substr(pos + sep.size()));
  return result;
}

SafeString SafeString::ljust(long width, const Value& fill) const {
  const std::string pad = fillCharacter(fill);
  const long length = static_cast<long>(utf8Length(payload_));
  if (width <= length) {
    return *this;
  }
  return SafeString(payload_ + repeat(pad, width - length));
}

SafeString SafeString::rjust(long width, const Value& fill) const {
  const std::string pad = fillCharacter(fill);
  const long length = static_cast<long>(utf8Length(payload_));
  if (width <= length) {
    return *this;
  }
  return SafeString(repeat(pad, width - length) + payload_);
}

SafeString SafeString::center(long width, const Value& fill) const {
  const std::string pad = fillCharacter(fill);
  const long length = static_cast<long>(utf8Length(payload_));
  if (width <= length) {
    return *this;
  }
  const long margin = width - length;
  // The odd column goes left when the width is odd.
  const long left = margin / 2 + (margin & width & 1);
  return SafeString(repeat(pad, left) + payload_ +
                    repeat(pad, margin - left));
}

SafeString SafeString::zfill(long width) const {
  const long length = static_cast<long>(utf8Length(payload_));
  if (width <= length) {
    return *this;
  }
  const std::size_t fill = static_cast<std::size_t>(width - length);
  std::string out = std::string(fill, '0') + payload_;
  if (!payload_.empty() && (payload_[0] == '+' || payload_[0] == '-')) {
    out[0] = payload_[0];
    out[fill] = '0';
  }
  return SafeString(out);
}

SafeString SafeString::expandtabs(int tabsize) const {
  std::string out;
  long column = 0;
  for (std::size_t i = 0; i < payload_.size(); ++i) {
    char c = payload_[i];
    if (c == '\t') {
      if (tabsize > 0) {
        long spaces = tabsize - column % tabsize;
        out.append(static_cast<std::size_t>(spaces), ' ');
        column += spaces;
      }
      continue;
    }
    out.push_back(c);
    if (c == '\n' || c == '\r') {
      column = 0;
    } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++column;
    }
  }
  return SafeString(out);
}

SafeString SafeString::translate(
    const std::map<std::string, Value>& table) const {
  std::vector<std::string> points = codepoints(payload_);
  std::string out;
  out.reserve(payload_.size());
  for (std::size_t i = 0; i < points.size(); ++i) {
    std::map<std::string, Value>::const_iterator it = table.find(points[i]);
    if (it == table.end()) {
      out.append(points[i]);
    } else if (!it->second.isNone()) {
      out.append(escape(it->second).str());
    }
  }
  return SafeString(out);
}

SafeString SafeString::slice(long start) const {
  return slice(start, static_cast<long>(utf8Length(payload_)));
}

SafeString SafeString::slice(long start, long stop) const {
  std::vector<std::string> points = codepoints(payload_);
  const long length = static_cast<long>(points.size());
  start = clampIndex(start, length);
  stop = clampIndex(stop, length);
  std::string out;
  for (long i = start; i < stop; ++i) {
    out.append(points[static_cast<std::size_t>(i)]);
  }
  return SafeString(out);
}

SafeString SafeString::at(long index) const {
  std::vector<std::string> points = codepoints(payload_);
  const long length = static_cast<long>(points.size());
  if (index < 0) {
    index += length;
  }
  if (index < 0 || index >= length) {
    throw std::out_of_range("string index out of range");
  }
  return SafeString(points[static_cast<std::size_t>(index)]);
}

std::string SafeString::unescape() const {
  return unescapeText(payload_);
}

std::string SafeString::striptags(bool normalize) const {
  std::string value = payload_;

  // Comments first, so a tag inside a comment cannot end it early.
  std::size_t start = value.find("<!--");
  while (start != std::string::npos) {
    std::size_t end = value.find("-->", start);
    if (end == std::string::npos) {
      break;
    }
    value.replace(start, end + 3 - start, " ");
    start = value.find("<!--", start);
  }

  start = value.find('<');
  while (start != std::string::npos) {
    std::size_t end = value.find('>', start);
    if (end == std::string::npos) {
      break;
    }
    value.replace(start, end + 1 - start, " ");
    start = value.find('<', start + 1);
  }

  if (normalize) {
    value = joinWithSpace(splitWhitespace(value));
  }
  return unescapeText(value);
}

SafeString join(const Value& separator, const std::vector<Value>& items) {
  return escape(separator).join(items);
}

SafeString operator+(const SafeString& lhs, const SafeString& rhs) {
  return SafeString(lhs.str() + rhs.str());
}

SafeString operator+(const SafeString& lhs, const Value& rhs) {
  return SafeString(lhs.str() + escape(rhs).str());
}

SafeString operator+(const Value& lhs, const SafeString& rhs) {
  return SafeString(escape(lhs).str() + rhs.str());
}

SafeString operator*(const SafeString& markup, int count) {
  std::string out;
  if (count > 0) {
    out.reserve(markup.size() * static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
      out.append(markup.str());
    }
  }
  return SafeString(out);
}

SafeString operator*(int count, const SafeString& markup) {
  return markup * count;
}

SafeString operator%(const SafeString& markup, const Value& arg) {
  return markup.interpolate(FormatArgs().add(arg));
}

SafeString operator%(const SafeString& markup, const FormatArgs& args) {
  return markup.interpolate(args);
}

bool operator==(const SafeString& lhs, const SafeString& rhs) {
  return lhs.str() == rhs.str();
}

bool operator!=(const SafeString& lhs, const SafeString& rhs) {
  return !(lhs == rhs);
}

bool operator<(const SafeString& lhs, const SafeString& rhs) {
  return lhs.str() < rhs.str();
}

std::ostream& operator<<(std::ostream& os, const SafeString& markup) {
  return os << markup.str();
}

}  // namespace markup
