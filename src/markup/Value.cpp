#include "markup/Value.hpp"

#include <climits>
#include <cmath>
#include <exception>
#include <locale>
#include <sstream>

#include "markup/Escapable.hpp"
#include "markup/SafeString.hpp"
#include "utils/Logger.hpp"

namespace markup {

namespace {

const char kNoneText[] = "None";

template <typename T>
std::string toDecimal(T number) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << number;
  return oss.str();
}

long long saturateSigned(double number) {
  if (std::isnan(number)) {
    return 0;
  }
  if (number >= 9223372036854775808.0) {
    return LLONG_MAX;
  }
  if (number < -9223372036854775808.0) {
    return LLONG_MIN;
  }
  return static_cast<long long>(number);
}

unsigned long long saturateUnsigned(double number) {
  if (std::isnan(number) || number <= 0) {
    return 0;
  }
  if (number >= 18446744073709551616.0) {
    return ULLONG_MAX;
  }
  return static_cast<unsigned long long>(number);
}

}  // namespace

Value::Value()
    : kind_(NONE), text_(kNoneText), integer_(0), unsigned_(0), double_(0),
      object_(NULL) {}

Value::Value(const char* text)
    : kind_(TEXT), integer_(0), unsigned_(0), double_(0), object_(NULL) {
  if (text == NULL) {
    kind_ = NONE;
    text_ = kNoneText;
  } else {
    text_ = text;
  }
}

Value::Value(const std::string& text)
    : kind_(TEXT), text_(text), integer_(0), unsigned_(0), double_(0),
      object_(NULL) {}

Value::Value(char c)
    : kind_(TEXT), text_(1, c), integer_(0), unsigned_(0), double_(0),
      object_(NULL) {}

Value::Value(bool flag)
    : kind_(BOOLEAN),
      text_(flag ? "true" : "false"),
      integer_(flag ? 1 : 0),
      unsigned_(flag ? 1 : 0),
      double_(flag ? 1 : 0),
      object_(NULL) {}

Value::Value(int number)
    : kind_(INTEGER),
      text_(toDecimal(number)),
      integer_(number),
      unsigned_(0),
      double_(number),
      object_(NULL) {}

Value::Value(long number)
    : kind_(INTEGER),
      text_(toDecimal(number)),
      integer_(number),
      unsigned_(0),
      double_(static_cast<double>(number)),
      object_(NULL) {}

Value::Value(long long number)
    : kind_(INTEGER),
      text_(toDecimal(number)),
      integer_(number),
      unsigned_(0),
      double_(static_cast<double>(number)),
      object_(NULL) {}

Value::Value(unsigned int number)
    : kind_(UNSIGNED),
      text_(toDecimal(number)),
      integer_(0),
      unsigned_(number),
      double_(number),
      object_(NULL) {}

Value::Value(unsigned long number)
    : kind_(UNSIGNED),
      text_(toDecimal(number)),
      integer_(0),
      unsigned_(number),
      double_(static_cast<double>(number)),
      object_(NULL) {}

Value::Value(unsigned long long number)
    : kind_(UNSIGNED),
      text_(toDecimal(number)),
      integer_(0),
      unsigned_(number),
      double_(static_cast<double>(number)),
      object_(NULL) {}

Value::Value(double number)
    : kind_(FLOAT),
      text_(formatDouble(number)),
      integer_(0),
      unsigned_(0),
      double_(number),
      object_(NULL) {}

Value::Value(const SafeString& markup)
    : kind_(MARKUP),
      text_(markup.str()),
      integer_(0),
      unsigned_(0),
      double_(0),
      object_(NULL) {}

Value::Value(const Escapable& object)
    : kind_(MARKUP),
      integer_(0),
      unsigned_(0),
      double_(0),
      object_(&object) {
  try {
    text_ = object.html();
  } catch (const std::exception& e) {
    MARKUP_LOG(DEBUG) << "html() hook failed: " << e.what();
    throw;
  }
}

Value::Value(const Value& other)
    : kind_(other.kind_),
      text_(other.text_),
      integer_(other.integer_),
      unsigned_(other.unsigned_),
      double_(other.double_),
      object_(other.object_) {}

Value& Value::operator=(const Value& other) {
  if (this != &other) {
    kind_ = other.kind_;
    text_ = other.text_;
    integer_ = other.integer_;
    unsigned_ = other.unsigned_;
    double_ = other.double_;
    object_ = other.object_;
  }
  return *this;
}

Value::~Value() {}

Value::Kind Value::kind() const {
  return kind_;
}

bool Value::isNone() const {
  return kind_ == NONE;
}

bool Value::isMarkup() const {
  return kind_ == MARKUP;
}

bool Value::isNumber() const {
  return kind_ == BOOLEAN || kind_ == INTEGER || kind_ == UNSIGNED ||
         kind_ == FLOAT;
}

const std::string& Value::text() const {
  return text_;
}

const Escapable* Value::escapable() const {
  return object_;
}

long long Value::asInteger() const {
  switch (kind_) {
    case UNSIGNED:
      return static_cast<long long>(unsigned_);
    case FLOAT:
      return saturateSigned(double_);
    default:
      return integer_;
  }
}

unsigned long long Value::asUnsigned() const {
  switch (kind_) {
    case INTEGER:
    case BOOLEAN:
      return static_cast<unsigned long long>(integer_);
    case FLOAT:
      return saturateUnsigned(double_);
    default:
      return unsigned_;
  }
}

double Value::asDouble() const {
  return double_;
}

bool Value::asBool() const {
  return integer_ != 0;
}

std::string Value::formatDouble(double number) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss.precision(15);
  oss << number;
  return oss.str();
}

}  // namespace markup
