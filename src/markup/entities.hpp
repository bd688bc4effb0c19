#pragma once

#include <string>

namespace markup {

/**
 * Look up an HTML 4 / XHTML named character reference ("amp", "raquo",
 * "apos", ...) without the surrounding '&' and ';'. Names are case
 * sensitive.
 *
 * @param name The reference name
 * @param codepoint Set to the referenced code point on success
 * @return true if the name is known
 */
bool lookupEntity(const std::string& name, unsigned long& codepoint);

/**
 * Replace character references with the characters they stand for.
 *
 * Handles named references (see lookupEntity), decimal "&#NNN;" and
 * hexadecimal "&#xHH;" / "&#XHH;" references. A reference must end with ';'.
 * Unknown names and malformed numbers are left as they are. Numeric
 * references to U+0000, to surrogates or beyond U+10FFFF become U+FFFD.
 * Output is UTF-8.
 */
std::string unescapeText(const std::string& text);

}  // namespace markup
