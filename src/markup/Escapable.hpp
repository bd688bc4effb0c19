#pragma once

#include <string>

namespace markup {

/**
 * Capability for types that render themselves as markup.
 *
 * escape() and every SafeString operation call html() instead of escaping
 * the object's text, and trust the result as-is. Implementations are
 * responsible for escaping whatever untrusted data they embed, usually by
 * building the result from SafeString values.
 *
 * Exceptions thrown by html() reach the caller of escape() unchanged.
 */
class Escapable {
 public:
  virtual ~Escapable();

  virtual std::string html() const = 0;

  /**
   * Render for a brace field with a format specification, such as the
   * "short" in "{:short}". The result is trusted like html().
   *
   * The default rejects every specification.
   *
   * @throws FormatError
   */
  virtual std::string htmlFormat(const std::string& spec) const;
};

}  // namespace markup
