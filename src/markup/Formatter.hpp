#pragma once

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "markup/Value.hpp"

namespace markup {

/**
 * Raised when a template and its arguments do not fit together: a missing
 * argument, leftover arguments, a malformed field or a format specification
 * that does not apply to the value.
 */
class FormatError : public std::runtime_error {
 public:
  explicit FormatError(const std::string& message);
};

/**
 * Arguments for SafeString::format() and SafeString::interpolate().
 *
 *   FormatArgs().add("<x>").add(42).add("user", name)
 *
 * Values are kept raw so that format specifications can still see numbers;
 * escaping happens when each field is rendered.
 */
class FormatArgs {
 public:
  FormatArgs();
  FormatArgs(const FormatArgs& other);
  FormatArgs& operator=(const FormatArgs& other);
  ~FormatArgs();

  // Append a positional argument.
  FormatArgs& add(const Value& value);
  // Set a named argument. A repeated name replaces the earlier value.
  FormatArgs& add(const std::string& name, const Value& value);

  std::size_t positionalCount() const;
  std::size_t namedCount() const;

  // NULL if there is no such argument.
  const Value* positional(std::size_t index) const;
  const Value* named(const std::string& name) const;

 private:
  std::vector<Value> positional_;
  std::map<std::string, Value> named_;
};

/**
 * Brace-style formatting ("{}", "{0}", "{name:>10.2f}", "{{", "}}").
 *
 * The literal parts of `markupTemplate` are taken as markup. Every field is
 * formatted from the raw value and then escaped. Markup values are inserted
 * unchanged. A specification on an Escapable goes to its htmlFormat(); on a
 * SafeString it is an error.
 *
 * Specifications support fill, align, sign, '#', '0', width, precision and
 * type. The ',' and '_' grouping options, nested fields ("{:{}}") and '!'
 * conversions are not supported and raise FormatError. Numbers are written
 * in the classic "C" locale.
 *
 * A template whose only field is a single "{}" needs exactly one positional
 * argument. Otherwise missing arguments are an error and unused ones are
 * ignored.
 *
 * @throws FormatError
 */
std::string formatBraces(const std::string& markupTemplate,
                         const FormatArgs& args);

/**
 * printf-style formatting ("%s", "%5d", "%.2f", "%(name)s", "%%").
 *
 * Fields take positional arguments in order, or named arguments when written
 * as "%(name)s"; the two forms cannot be mixed. Every positional argument
 * must be consumed.
 *
 * @throws FormatError
 */
std::string formatPercent(const std::string& markupTemplate,
                          const FormatArgs& args);

}  // namespace markup
