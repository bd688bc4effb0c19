#pragma once

#include <cstddef>
#include <string>

namespace markup {

/**
 * Escape a string for safe inclusion in HTML or XML, both in content and in
 * quoted attribute values.
 * Converts special characters to their entity equivalents:
 * - & → &amp;
 * - < → &lt;
 * - > → &gt;
 * - " → &#34;
 * - ' → &#39;
 *
 * Input is UTF-8. Multi-byte sequences never contain these ASCII bytes, so
 * they pass through untouched. Input without special characters is returned
 * as an unchanged copy.
 *
 * Two implementations exist and are selected when the library is built (see
 * the MARKUP_FAST_ESCAPER option). Both produce identical output.
 *
 * @param input The text to escape
 * @return The escaped text
 */
std::string escapeText(const std::string& input);

/**
 * Length escapeText(input) will have, computed without building it.
 */
std::size_t escapedLength(const std::string& input);

/**
 * Name of the linked implementation: "simple" or "fast".
 */
const char* escaperBackend();

}  // namespace markup
