#pragma once

#include <string>

namespace markup {

class Escapable;
class SafeString;

/**
 * Any value that can be handed to escape() or combined with a SafeString.
 *
 * A Value remembers what it was built from so the entry point can decide
 * between passing through (markup), writing a canonical form (none, booleans,
 * numbers) and escaping (text). Conversions are implicit on purpose: every
 * operation that takes a Value escapes it, so there is no unsafe path.
 *
 * Building a Value from an Escapable calls its html() hook right away. The
 * Value also keeps a pointer to the object so that a format specification
 * can be handed to Escapable::htmlFormat() later; the object must outlive
 * any formatting that uses a specification.
 *
 * Pointers other than `const char*` are rejected at compile time instead of
 * decaying to bool.
 */
class Value {
 public:
  enum Kind { NONE, BOOLEAN, INTEGER, UNSIGNED, FLOAT, TEXT, MARKUP };

  Value();
  Value(const char* text);
  Value(const std::string& text);
  Value(char c);
  Value(bool flag);
  Value(int number);
  Value(long number);
  Value(long long number);
  Value(unsigned int number);
  Value(unsigned long number);
  Value(unsigned long long number);
  Value(double number);
  Value(const SafeString& markup);
  Value(const Escapable& object);
  template <typename T>
  Value(const T* pointer) = delete;
  Value(const Value& other);
  Value& operator=(const Value& other);
  ~Value();

  Kind kind() const;
  bool isNone() const;
  bool isMarkup() const;
  bool isNumber() const;

  // Raw text for TEXT, the trusted payload for MARKUP and the canonical form
  // ("None", "true", "42", "3.14") for the other kinds.
  const std::string& text() const;

  // The Escapable this Value was built from, or NULL.
  const Escapable* escapable() const;

  // FLOAT values are truncated and saturate at the limits of the result
  // type; NaN gives 0.
  long long asInteger() const;
  unsigned long long asUnsigned() const;
  double asDouble() const;
  bool asBool() const;

  // Canonical text of a double: up to 15 significant digits, %g style.
  static std::string formatDouble(double number);

 private:
  Kind kind_;
  std::string text_;
  long long integer_;
  unsigned long long unsigned_;
  double double_;
  const Escapable* object_;
};

}  // namespace markup
