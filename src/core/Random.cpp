#include "ridgeline/core/Random.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

namespace ridgeline::core {

bool parseSeed(std::string_view text, u64& out) {
  if (text.empty()) return false;

  bool digits = true;
  for (unsigned char c : text) {
    if (!std::isdigit(c)) {
      digits = false;
      break;
    }
  }

  if (digits) {
    const std::string s(text);
    errno = 0;
    const unsigned long long v = std::strtoull(s.c_str(), nullptr, 10);
    if (errno != ERANGE) {
      out = static_cast<u64>(v);
      return true;
    }
    // Too long for 64 bits: hashed like any other text.
  }

  out = seedFromText(text);
  return true;
}

u64 batchSeed(u64 base, u64 index) {
  return index == 0 ? base : hashCombine(base, index);
}

} // namespace ridgeline::core
