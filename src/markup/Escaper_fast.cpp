#include <cstring>

#include "markup/Escaper.hpp"

namespace markup {

namespace {

// Entity for a special character, or NULL if `c` needs no escaping.
const char* entityFor(char c, std::size_t& length) {
  switch (c) {
    case '&':
      length = 5;
      return "&amp;";
    case '<':
      length = 4;
      return "&lt;";
    case '>':
      length = 4;
      return "&gt;";
    case '"':
      length = 5;
      return "&#34;";
    case '\'':
      length = 5;
      return "&#39;";
    default:
      return NULL;
  }
}

}  // namespace

// Measure first so the output is allocated exactly once, then copy runs of
// unchanged bytes in bulk between the entities.
std::string escapeText(const std::string& input) {
  const std::size_t total = escapedLength(input);
  if (total == input.size()) {
    return input;
  }

  std::string out(total, '\0');
  char* outp = &out[0];
  const char* inp = input.data();
  const char* const inp_end = inp + input.size();
  const char* run = inp;

  for (; inp < inp_end; ++inp) {
    std::size_t length = 0;
    const char* entity = entityFor(*inp, length);
    if (entity == NULL) {
      continue;
    }
    std::size_t ncopy = static_cast<std::size_t>(inp - run);
    std::memcpy(outp, run, ncopy);
    outp += ncopy;
    std::memcpy(outp, entity, length);
    outp += length;
    run = inp + 1;
  }
  std::memcpy(outp, run, static_cast<std::size_t>(inp_end - run));
  return out;
}

const char* escaperBackend() {
  return "fast";
}

}  // namespace markup
