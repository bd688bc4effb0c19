#include "markup/escape.hpp"

#include "markup/Escaper.hpp"

namespace markup {

SafeString escape(const Value& value) {
  switch (value.kind()) {
    case Value::TEXT:
      return SafeString(escapeText(value.text()));
    default:
      // Markup is trusted; canonical forms have nothing to escape.
      return SafeString(value.text());
  }
}

SafeString escapeSilent(const Value& value) {
  if (value.isNone()) {
    return SafeString();
  }
  return escape(value);
}

}  // namespace markup
