#pragma once

#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "markup/Value.hpp"

namespace markup {

class FormatArgs;
struct Partition;

/**
 * Text that is safe to insert into an HTML or XML document as-is, because it
 * was escaped or because it was explicitly trusted.
 *
 * Being a SafeString is the only mark of safety; there is no flag. Instances
 * come from escape()/escapeSilent(), from the trusted constructor, or from
 * operations on other SafeStrings. Every operation that takes an extra
 * operand escapes it first (SafeString operands are left alone), so results
 * stay safe:
 *
 *   SafeString("<em>%s</em>") % "foo & bar"   -> <em>foo &amp; bar</em>
 *   SafeString("<em>Hello</em> ") + "<foo>"   -> <em>Hello</em> &lt;foo&gt;
 *
 * The payload is UTF-8. Instances are immutable; every operation returns a
 * new SafeString.
 */
class SafeString {
 public:
  SafeString();

  /**
   * Wrap `markup` without escaping it. The caller vouches that it contains
   * no untrusted data. Passing user input here is the one way to
   * reintroduce an injection vulnerability; use escape() instead.
   */
  explicit SafeString(const std::string& markup);

  SafeString(const SafeString& other);
  SafeString& operator=(const SafeString& other);
  ~SafeString();

  const std::string& str() const;
  std::size_t size() const;
  bool empty() const;

  // Join `items` with this string as the separator. Every item is escaped.
  SafeString join(const std::vector<Value>& items) const;

  template <typename InputIt>
  SafeString join(InputIt first, InputIt last) const {
    std::vector<Value> items;
    for (; first != last; ++first) {
      items.push_back(Value(*first));
    }
    return join(items);
  }

  // Brace-style formatting, see formatBraces().
  SafeString format(const FormatArgs& args) const;
  // printf-style formatting, see formatPercent().
  SafeString interpolate(const FormatArgs& args) const;

  // Case mapping is ASCII only. Entities keep their meaning because case
  // changes never produce one of the escaped characters.
  SafeString lower() const;
  SafeString upper() const;
  SafeString capitalize() const;
  SafeString title() const;
  SafeString swapcase() const;
  SafeString casefold() const;
  bool equalsIgnoreCase(const Value& other) const;

  // Without an argument, strips ASCII whitespace. Otherwise strips any of
  // the code points of the escaped argument.
  SafeString strip() const;
  SafeString strip(const Value& chars) const;
  SafeString lstrip() const;
  SafeString lstrip(const Value& chars) const;
  SafeString rstrip() const;
  SafeString rstrip(const Value& chars) const;

  SafeString removeprefix(const Value& prefix) const;
  SafeString removesuffix(const Value& suffix) const;

  bool startswith(const Value& prefix) const;
  bool endswith(const Value& suffix) const;
  bool contains(const Value& needle) const;

  // Replace up to `count` occurrences (all if negative). An empty `old`
  // inserts `replacement` around every code point.
  SafeString replace(const Value& old, const Value& replacement,
                     long count = -1) const;

  // Split on runs of whitespace, dropping empty fragments.
  std::vector<SafeString> split() const;
  // Split on `separator` at most `maxsplit` times (no limit if negative).
  // A none separator splits on whitespace.
  // @throws std::invalid_argument if the escaped separator is empty
  std::vector<SafeString> split(const Value& separator,
                                long maxsplit = -1) const;
  std::vector<SafeString> rsplit(const Value& separator,
                                 long maxsplit = -1) const;
  std::vector<SafeString> splitlines(bool keepends = false) const;
  Partition partition(const Value& separator) const;
  Partition rpartition(const Value& separator) const;

  // Pad to `width` code points. The fill is escaped first and must then be
  // a single code point, so "<" and "&" are rejected.
  // @throws std::invalid_argument
  SafeString ljust(long width, const Value& fill = " ") const;
  SafeString rjust(long width, const Value& fill = " ") const;
  SafeString center(long width, const Value& fill = " ") const;
  // Pad on the left with '0', after a leading '+' or '-'.
  SafeString zfill(long width) const;
  // Replace tabs with spaces up to the next multiple of `tabsize` columns.
  SafeString expandtabs(int tabsize = 8) const;

  // Map single code points of the payload. A none value deletes the code
  // point; any other value is escaped and inserted.
  SafeString translate(const std::map<std::string, Value>& table) const;

  // Code points [start, stop), with negative indexes counted from the end
  // and out of range indexes clamped. Slicing works on the escaped payload
  // and can cut an entity apart.
  SafeString slice(long start) const;
  SafeString slice(long start, long stop) const;
  // One code point.
  // @throws std::out_of_range
  SafeString at(long index) const;

  /**
   * Decode character references back into text. The result is plain text,
   * no longer safe for markup.
   *
   *   SafeString("Main &raquo; <em>About</em>").unescape()
   *     -> "Main » <em>About</em>"
   */
  std::string unescape() const;

  /**
   * Remove comments and tags, then unescape. Each removed tag leaves a
   * space; with `normalize`, whitespace runs collapse to one space and the
   * ends are trimmed.
   *
   *   SafeString("Main &raquo;\t<em>About</em>").striptags()
   *     -> "Main » About"
   *
   * This is a convenience for producing plain text, not a sanitizer. Do
   * not use it to clean untrusted HTML.
   */
  std::string striptags(bool normalize = true) const;

 private:
  std::string payload_;
};

// Result of SafeString::partition() and SafeString::rpartition().
struct Partition {
  SafeString head;
  SafeString separator;
  SafeString tail;
};

SafeString join(const Value& separator, const std::vector<Value>& items);

SafeString operator+(const SafeString& lhs, const SafeString& rhs);
SafeString operator+(const SafeString& lhs, const Value& rhs);
SafeString operator+(const Value& lhs, const SafeString& rhs);

// Repeat `count` times; empty if `count` is not positive.
SafeString operator*(const SafeString& markup, int count);
SafeString operator*(int count, const SafeString& markup);

// printf-style formatting with a single argument or a full argument list.
SafeString operator%(const SafeString& markup, const Value& arg);
SafeString operator%(const SafeString& markup, const FormatArgs& args);

bool operator==(const SafeString& lhs, const SafeString& rhs);
bool operator!=(const SafeString& lhs, const SafeString& rhs);
bool operator<(const SafeString& lhs, const SafeString& rhs);

std::ostream& operator<<(std::ostream& os, const SafeString& markup);

}  // namespace markup
