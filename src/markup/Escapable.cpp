#include "markup/Escapable.hpp"

#include "markup/Formatter.hpp"
#include "utils/Logger.hpp"

namespace markup {

Escapable::~Escapable() {}

std::string Escapable::htmlFormat(const std::string& spec) const {
  MARKUP_LOG(DEBUG) << "Format error: unsupported specification '" << spec
                    << "' for a markup object";
  throw FormatError("Unsupported format specification '" + spec +
                    "' for a markup object");
}

}  // namespace markup
