#include "markup/Formatter.hpp"

#include <algorithm>
#include <cmath>
#include <locale>
#include <sstream>

#include "markup/Escapable.hpp"
#include "markup/Escaper.hpp"
#include "markup/SafeString.hpp"
#include "markup/escape.hpp"
#include "utils/Logger.hpp"
#include "utils/utils.hpp"

namespace markup {

FormatError::FormatError(const std::string& message)
    : std::runtime_error(message) {}

FormatArgs::FormatArgs() {}

FormatArgs::FormatArgs(const FormatArgs& other)
    : positional_(other.positional_), named_(other.named_) {}

FormatArgs& FormatArgs::operator=(const FormatArgs& other) {
  if (this != &other) {
    positional_ = other.positional_;
    named_ = other.named_;
  }
  return *this;
}

FormatArgs::~FormatArgs() {}

FormatArgs& FormatArgs::add(const Value& value) {
  positional_.push_back(value);
  return *this;
}

FormatArgs& FormatArgs::add(const std::string& name, const Value& value) {
  named_[name] = value;
  return *this;
}

std::size_t FormatArgs::positionalCount() const {
  return positional_.size();
}

std::size_t FormatArgs::namedCount() const {
  return named_.size();
}

const Value* FormatArgs::positional(std::size_t index) const {
  if (index >= positional_.size()) {
    return NULL;
  }
  return &positional_[index];
}

const Value* FormatArgs::named(const std::string& name) const {
  std::map<std::string, Value>::const_iterator it = named_.find(name);
  if (it == named_.end()) {
    return NULL;
  }
  return &it->second;
}

namespace {

const long long kMaxFieldWidth = 1048576;

enum Numbering { NUMBERING_NONE, NUMBERING_AUTO, NUMBERING_MANUAL };

// Parsed format specification, shared by both template styles.
struct FieldSpec {
  FieldSpec()
      : fill(" "),
        align('\0'),
        textAlign('<'),
        sign('\0'),
        alternate(false),
        zero(false),
        width(0),
        precision(-1),
        type('\0') {}

  std::string fill;  // one code point
  char align;        // '<', '>', '^', '=' or '\0' for the default
  char textAlign;    // default alignment for text
  char sign;         // '+', '-', ' ' or '\0'
  bool alternate;
  bool zero;
  std::size_t width;
  int precision;
  char type;
};

// Construct and log a FormatError. Callers throw the result.
FormatError formatError(const std::string& message) {
  MARKUP_LOG(DEBUG) << "Format error: " << message;
  return FormatError(message);
}

bool isDigit(char c) {
  return c >= '0' && c <= '9';
}

bool isDigits(const std::string& str) {
  if (str.empty()) {
    return false;
  }
  for (size_t i = 0; i < str.size(); ++i) {
    if (!isDigit(str[i])) {
      return false;
    }
  }
  return true;
}

bool isIdentifier(const std::string& str) {
  if (str.empty() || isDigit(str[0])) {
    return false;
  }
  for (size_t i = 0; i < str.size(); ++i) {
    char c = str[i];
    if (!(isDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
          c == '_')) {
      return false;
    }
  }
  return true;
}

bool isAlign(char c) {
  return c == '<' || c == '>' || c == '^' || c == '=';
}

std::size_t codepointLength(const std::string& str, std::size_t pos) {
  std::size_t len = 1;
  while (pos + len < str.size() &&
         (static_cast<unsigned char>(str[pos + len]) & 0xC0) == 0x80) {
    ++len;
  }
  return len;
}

std::string readDigits(const std::string& str, std::size_t& pos) {
  std::size_t start = pos;
  while (pos < str.size() && isDigit(str[pos])) {
    ++pos;
  }
  return str.substr(start, pos - start);
}

std::size_t parseCount(const std::string& digits) {
  long long value = 0;
  if (!safeStrtoll(digits, value) || value > kMaxFieldWidth) {
    throw formatError("Too many decimal digits in format string");
  }
  return static_cast<std::size_t>(value);
}

std::string toString(std::size_t number) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << number;
  return oss.str();
}

// [[fill]align][sign][#][0][width][.precision][type]
FieldSpec parseBraceSpec(const std::string& spec) {
  FieldSpec field;
  std::size_t pos = 0;

  if (!spec.empty()) {
    std::size_t fillLength = codepointLength(spec, 0);
    if (fillLength < spec.size() && isAlign(spec[fillLength])) {
      field.fill = spec.substr(0, fillLength);
      field.align = spec[fillLength];
      pos = fillLength + 1;
    } else if (isAlign(spec[0])) {
      field.align = spec[0];
      pos = 1;
    }
  }
  if (pos < spec.size() &&
      (spec[pos] == '+' || spec[pos] == '-' || spec[pos] == ' ')) {
    field.sign = spec[pos++];
  }
  if (pos < spec.size() && spec[pos] == '#') {
    field.alternate = true;
    ++pos;
  }
  if (pos < spec.size() && spec[pos] == '0') {
    field.zero = true;
    ++pos;
  }
  std::string width = readDigits(spec, pos);
  if (!width.empty()) {
    field.width = parseCount(width);
  }
  if (pos < spec.size() && spec[pos] == '.') {
    ++pos;
    std::string precision = readDigits(spec, pos);
    if (precision.empty()) {
      throw formatError("Format specifier missing precision");
    }
    field.precision = static_cast<int>(parseCount(precision));
  }
  if (pos < spec.size()) {
    field.type = spec[pos++];
  }
  if (pos != spec.size()) {
    throw formatError("Invalid format specifier '" + spec + "'");
  }
  return field;
}

std::string repeat(const std::string& fill, std::size_t count) {
  std::string out;
  out.reserve(fill.size() * count);
  for (std::size_t i = 0; i < count; ++i) {
    out.append(fill);
  }
  return out;
}

// Pad `head` + `body` to the field width. `head` is the sign and radix
// prefix, which '=' alignment and the zero flag keep in front of the padding.
std::string applyWidth(const std::string& head, const std::string& body,
                       const FieldSpec& spec, bool numeric) {
  std::string text = head + body;
  std::size_t length = utf8Length(text);
  if (spec.width <= length) {
    return text;
  }
  std::size_t padding = spec.width - length;

  char align = spec.align;
  std::string fill = spec.fill;
  if (align == '\0') {
    if (numeric && spec.zero) {
      align = '=';
      fill = "0";
    } else {
      align = numeric ? '>' : spec.textAlign;
    }
  }

  switch (align) {
    case '<':
      return text + repeat(fill, padding);
    case '^': {
      std::size_t left = padding / 2;
      return repeat(fill, left) + text + repeat(fill, padding - left);
    }
    case '=':
      return head + repeat(fill, padding) + body;
    default:
      return repeat(fill, padding) + text;
  }
}

std::string signString(bool negative, char sign) {
  if (negative) {
    return "-";
  }
  if (sign == '+') {
    return "+";
  }
  if (sign == ' ') {
    return " ";
  }
  return "";
}

std::string integerDigits(unsigned long long magnitude, char type) {
  const char* digits = "0123456789abcdef";
  unsigned int base = 10;
  switch (type) {
    case 'x':
      base = 16;
      break;
    case 'X':
      base = 16;
      digits = "0123456789ABCDEF";
      break;
    case 'o':
      base = 8;
      break;
    case 'b':
      base = 2;
      break;
    default:
      break;
  }
  if (magnitude == 0) {
    return "0";
  }
  std::string out;
  while (magnitude > 0) {
    out.push_back(digits[magnitude % base]);
    magnitude /= base;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

std::string integerPrefix(char type) {
  switch (type) {
    case 'x':
      return "0x";
    case 'X':
      return "0X";
    case 'o':
      return "0o";
    case 'b':
      return "0b";
    default:
      return "";
  }
}

// printf-style %e/%f/%g digits of a non-negative value, independent of the
// global locale.
std::string floatDigits(double magnitude, char type, int precision,
                        bool alternate) {
  if (precision < 0) {
    precision = 6;
  }
  std::string suffix;
  if (type == '%') {
    magnitude *= 100;
    type = 'f';
    suffix = "%";
  }
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss.precision(precision);
  switch (type) {
    case 'f':
    case 'F':
      oss << std::fixed;
      break;
    case 'e':
    case 'E':
      oss << std::scientific;
      break;
    default:
      break;
  }
  if (type == 'F' || type == 'E' || type == 'G') {
    oss << std::uppercase;
  }
  if (alternate) {
    oss << std::showpoint;
  }
  oss << magnitude;
  return oss.str() + suffix;
}

std::string typeName(const Value& value) {
  switch (value.kind()) {
    case Value::NONE:
      return "None";
    case Value::BOOLEAN:
      return "bool";
    case Value::INTEGER:
    case Value::UNSIGNED:
      return "int";
    case Value::FLOAT:
      return "float";
    case Value::MARKUP:
      return "markup";
    default:
      return "str";
  }
}

std::string unknownCode(char type, const Value& value) {
  return std::string("Unknown format code '") + type +
         "' for object of type '" + typeName(value) + "'";
}

// Format a non-markup value according to `spec`. The result is raw text and
// still needs escaping.
std::string renderField(const Value& value, const FieldSpec& spec) {
  const char type = spec.type;
  const Value::Kind kind = value.kind();
  const bool textual =
      kind == Value::TEXT || kind == Value::NONE || kind == Value::BOOLEAN;

  if (type == 's' || (type == '\0' && textual)) {
    if (!textual) {
      throw formatError(unknownCode(type, value));
    }
    if (spec.sign != '\0') {
      throw formatError("Sign not allowed in string format specifier");
    }
    if (spec.align == '=') {
      throw formatError("'=' alignment not allowed in string format specifier");
    }
    std::string body = value.text();
    if (spec.precision >= 0) {
      body = utf8Truncate(body, static_cast<std::size_t>(spec.precision));
    }
    return applyWidth("", body, spec, false);
  }

  if (kind == Value::TEXT || kind == Value::NONE) {
    throw formatError(unknownCode(type, value));
  }

  if (type == 'd' || type == 'x' || type == 'X' || type == 'o' ||
      type == 'b' || (type == '\0' && kind != Value::FLOAT)) {
    if (kind == Value::FLOAT) {
      throw formatError(unknownCode(type, value));
    }
    if (spec.precision >= 0) {
      throw formatError("Precision not allowed in integer format specifier");
    }
    bool negative = false;
    unsigned long long magnitude = 0;
    if (kind == Value::UNSIGNED) {
      magnitude = value.asUnsigned();
    } else {
      long long number = value.asInteger();
      negative = number < 0;
      magnitude = negative ? 0ULL - static_cast<unsigned long long>(number)
                           : static_cast<unsigned long long>(number);
    }
    std::string head = signString(negative, spec.sign);
    if (spec.alternate) {
      head += integerPrefix(type);
    }
    return applyWidth(head, integerDigits(magnitude, type), spec, true);
  }

  if (type == 'f' || type == 'F' || type == 'e' || type == 'E' ||
      type == 'g' || type == 'G' || type == '%' || type == '\0') {
    double number = value.asDouble();
    bool negative = !std::isnan(number) && std::signbit(number);
    double magnitude = std::fabs(number);
    std::string body;
    if (type == '\0') {
      body = spec.precision < 0
                 ? Value::formatDouble(magnitude)
                 : floatDigits(magnitude, 'g', spec.precision, spec.alternate);
    } else {
      body = floatDigits(magnitude, type, spec.precision, spec.alternate);
    }
    return applyWidth(signString(negative, spec.sign), body, spec, true);
  }

  throw formatError(unknownCode(type, value));
}

// %d of a float: the integer part, exact even outside the range of
// long long.
std::string truncatedFloat(double number, const FieldSpec& spec) {
  double whole = std::trunc(number);
  if (whole >= -9223372036854775808.0 && whole < 9223372036854775808.0) {
    return renderField(Value(static_cast<long long>(whole)), spec);
  }
  std::string digits = floatDigits(std::fabs(whole), 'f', 0, false);
  return applyWidth(signString(whole < 0, spec.sign), digits, spec, true);
}

const Value& lookupPositional(const FormatArgs& args, std::size_t index) {
  const Value* value = args.positional(index);
  if (value == NULL) {
    throw formatError("Replacement index " + toString(index) +
                      " out of range: " + toString(args.positionalCount()) +
                      " positional arguments given");
  }
  return *value;
}

std::string renderBraceField(const Value& value, const std::string& spec) {
  if (value.isMarkup()) {
    if (spec.empty()) {
      return value.text();
    }
    if (value.escapable() != NULL) {
      return value.escapable()->htmlFormat(spec);
    }
    throw formatError("Format specification '" + spec +
                      "' given for a markup value");
  }
  if (spec.empty()) {
    return escape(value).str();
  }
  return escapeText(renderField(value, parseBraceSpec(spec)));
}

std::string renderPercentField(const Value& value, FieldSpec spec,
                               char conversion) {
  switch (conversion) {
    case 's':
      if (value.isMarkup()) {
        if (spec.precision >= 0) {
          throw formatError("Precision not allowed for a markup value");
        }
        // Space padding cannot break markup.
        spec.fill = " ";
        spec.zero = false;
        return applyWidth("", value.text(), spec, false);
      }
      spec.type = 's';
      spec.sign = '\0';
      return escapeText(renderField(Value(value.text()), spec));
    case 'd':
    case 'i':
    case 'u':
      if (!value.isNumber()) {
        throw formatError(std::string("%") + conversion +
                          " format: a number is required, not " +
                          typeName(value));
      }
      spec.type = 'd';
      spec.precision = -1;
      if (value.kind() == Value::FLOAT) {
        double number = value.asDouble();
        if (std::isnan(number) || std::isinf(number)) {
          throw formatError("Cannot convert float " + value.text() +
                            " to integer");
        }
        return escapeText(truncatedFloat(number, spec));
      }
      return escapeText(renderField(value, spec));
    case 'x':
    case 'X':
    case 'o':
      if (!value.isNumber() || value.kind() == Value::FLOAT) {
        throw formatError(std::string("%") + conversion +
                          " format: an integer is required, not " +
                          typeName(value));
      }
      spec.type = conversion;
      spec.precision = -1;
      return escapeText(renderField(value, spec));
    case 'e':
    case 'E':
    case 'f':
    case 'F':
    case 'g':
    case 'G':
      if (!value.isNumber()) {
        throw formatError("Must be real number, not " + typeName(value));
      }
      spec.type = conversion;
      if (value.kind() != Value::FLOAT) {
        return escapeText(renderField(Value(value.asDouble()), spec));
      }
      return escapeText(renderField(value, spec));
    default:
      throw formatError(std::string("Unsupported format character '") +
                        conversion + "'");
  }
}

}  // namespace

std::string formatBraces(const std::string& markupTemplate,
                         const FormatArgs& args) {
  std::string out;
  out.reserve(markupTemplate.size());
  Numbering numbering = NUMBERING_NONE;
  std::size_t autoIndex = 0;
  std::size_t fieldCount = 0;

  std::size_t idx = 0;
  while (idx < markupTemplate.size()) {
    char c = markupTemplate[idx];
    if (c == '}') {
      if (idx + 1 < markupTemplate.size() && markupTemplate[idx + 1] == '}') {
        out.push_back('}');
        idx += 2;
        continue;
      }
      throw formatError("Single '}' encountered in format string");
    }
    if (c != '{') {
      out.push_back(c);
      ++idx;
      continue;
    }
    if (idx + 1 < markupTemplate.size() && markupTemplate[idx + 1] == '{') {
      out.push_back('{');
      idx += 2;
      continue;
    }

    std::size_t close = markupTemplate.find('}', idx + 1);
    if (close == std::string::npos) {
      throw formatError("Single '{' encountered in format string");
    }
    std::string field = markupTemplate.substr(idx + 1, close - idx - 1);
    idx = close + 1;
    ++fieldCount;
    if (field.find('{') != std::string::npos) {
      throw formatError("Nested replacement fields are not supported");
    }

    std::string name = field;
    std::string spec;
    std::size_t colon = field.find(':');
    if (colon != std::string::npos) {
      name = field.substr(0, colon);
      spec = field.substr(colon + 1);
    }
    if (name.find('!') != std::string::npos) {
      throw formatError("Conversion flags are not supported in field '" +
                        field + "'");
    }

    if (name.empty()) {
      if (numbering == NUMBERING_MANUAL) {
        throw formatError(
            "Cannot switch from manual field specification to automatic "
            "field numbering");
      }
      numbering = NUMBERING_AUTO;
      out.append(renderBraceField(lookupPositional(args, autoIndex++), spec));
    } else if (isDigits(name)) {
      if (numbering == NUMBERING_AUTO) {
        throw formatError(
            "Cannot switch from automatic field numbering to manual field "
            "specification");
      }
      numbering = NUMBERING_MANUAL;
      out.append(renderBraceField(lookupPositional(args, parseCount(name)),
                                  spec));
    } else if (isIdentifier(name)) {
      const Value* value = args.named(name);
      if (value == NULL) {
        throw formatError("Missing named argument '" + name + "'");
      }
      out.append(renderBraceField(*value, spec));
    } else {
      throw formatError("Invalid field name '" + name + "'");
    }
  }

  // A lone "{}" with the wrong number of arguments is ambiguous rather than
  // a template with unused extras.
  if (numbering == NUMBERING_AUTO && fieldCount == 1 &&
      args.positionalCount() != 1) {
    throw formatError(
        "Template with a single '{}' field needs exactly one positional "
        "argument, got " +
        toString(args.positionalCount()));
  }
  return out;
}

std::string formatPercent(const std::string& markupTemplate,
                          const FormatArgs& args) {
  std::string out;
  out.reserve(markupTemplate.size());
  std::size_t nextIndex = 0;
  bool sawNamed = false;
  bool sawPositional = false;

  std::size_t idx = 0;
  const std::size_t size = markupTemplate.size();
  while (idx < size) {
    char c = markupTemplate[idx];
    if (c != '%') {
      out.push_back(c);
      ++idx;
      continue;
    }
    ++idx;
    if (idx >= size) {
      throw formatError("Incomplete format");
    }
    if (markupTemplate[idx] == '%') {
      out.push_back('%');
      ++idx;
      continue;
    }

    std::string name;
    bool named = false;
    if (markupTemplate[idx] == '(') {
      int depth = 1;
      std::size_t start = ++idx;
      while (idx < size && depth > 0) {
        if (markupTemplate[idx] == '(') {
          ++depth;
        } else if (markupTemplate[idx] == ')') {
          --depth;
        }
        ++idx;
      }
      if (depth > 0) {
        throw formatError("Incomplete format key");
      }
      name = markupTemplate.substr(start, idx - start - 1);
      named = true;
    }

    FieldSpec spec;
    spec.textAlign = '>';
    bool flags = true;
    while (flags && idx < size) {
      switch (markupTemplate[idx]) {
        case '-':
          spec.align = '<';
          break;
        case '+':
          spec.sign = '+';
          break;
        case ' ':
          if (spec.sign != '+') {
            spec.sign = ' ';
          }
          break;
        case '#':
          spec.alternate = true;
          break;
        case '0':
          spec.zero = true;
          break;
        default:
          flags = false;
          continue;
      }
      ++idx;
    }
    if (idx < size && markupTemplate[idx] == '*') {
      throw formatError("'*' width is not supported");
    }
    std::string width = readDigits(markupTemplate, idx);
    if (!width.empty()) {
      spec.width = parseCount(width);
    }
    if (idx < size && markupTemplate[idx] == '.') {
      ++idx;
      std::string precision = readDigits(markupTemplate, idx);
      spec.precision =
          precision.empty() ? 0 : static_cast<int>(parseCount(precision));
    }
    while (idx < size && (markupTemplate[idx] == 'h' ||
                          markupTemplate[idx] == 'l' ||
                          markupTemplate[idx] == 'L')) {
      ++idx;
    }
    if (idx >= size) {
      throw formatError("Incomplete format");
    }
    char conversion = markupTemplate[idx++];

    const Value* value = NULL;
    if (named) {
      sawNamed = true;
      value = args.named(name);
      if (value == NULL) {
        throw formatError("Missing named argument '" + name + "'");
      }
    } else {
      sawPositional = true;
      value = args.positional(nextIndex++);
      if (value == NULL) {
        throw formatError("Not enough arguments for format string");
      }
    }
    if (sawNamed && sawPositional) {
      throw formatError(
          "Cannot mix named and positional fields in format string");
    }
    out.append(renderPercentField(*value, spec, conversion));
  }

  if (nextIndex < args.positionalCount()) {
    throw formatError("Not all arguments converted during string formatting");
  }
  return out;
}

}  // namespace markup
