#pragma once

#include <sstream>

#include "markup/SafeString.hpp"
#include "markup/Value.hpp"

namespace markup {

/**
 * Convert any value to markup. This is the only path from untrusted text to
 * a SafeString.
 *
 * - SafeString: returned unchanged, so escape(escape(x)) == escape(x).
 * - Escapable: the output of html() is trusted and not escaped again.
 *   Exceptions thrown by the hook propagate unchanged.
 * - none, booleans and numbers: canonical text ("None", "true", "42",
 *   "3.14"), which never contains special characters.
 * - text: escaped with escapeText().
 *
 * A null marker is a default-constructed Value or a null const char*.
 */
SafeString escape(const Value& value);

/**
 * Like escape(), but the null marker becomes an empty SafeString instead of
 * "None". Meant for templates, where a missing value should print nothing.
 */
SafeString escapeSilent(const Value& value);

/**
 * Escape anything that can be written to a std::ostream, using operator<< as
 * its text representation.
 */
template <typename T>
SafeString escapeStreamable(const T& object) {
  std::ostringstream oss;
  oss << object;
  return escape(Value(oss.str()));
}

}  // namespace markup
