#include "markup/Escaper.hpp"

namespace markup {

std::size_t escapedLength(const std::string& input) {
  std::size_t length = input.size();
  for (size_t i = 0; i < input.size(); ++i) {
    switch (input[i]) {
      case '&':
      case '"':
      case '\'':
        length += 4;
        break;
      case '<':
      case '>':
        length += 3;
        break;
      default:
        break;
    }
  }
  return length;
}

}  // namespace markup
