#include "match.hpp"

#include <cstddef>

namespace rawpath {
namespace detail {
namespace {

constexpr int kMaxBacktracks = 10000;

// Byte length of the UTF-8 sequence starting at str[i].
size_t rune_length(std::string_view str, size_t i) {
  auto c = static_cast<unsigned char>(str[i]);
  size_t n = 1;
  if (c >= 0xF0) {
    n = 4;
  } else if (c >= 0xE0) {
    n = 3;
  } else if (c >= 0xC0) {
    n = 2;
  }
  return i + n <= str.size() ? n : str.size() - i;
}

}  // namespace

bool match_pattern(std::string_view str, std::string_view pattern) {
  if (pattern == "*") {
    return true;
  }
  size_t s = 0;
  size_t p = 0;
  size_t star = std::string_view::npos;
  size_t star_s = 0;
  int backtracks = 0;
  while (s < str.size()) {
    if (p < pattern.size()) {
      char pc = pattern[p];
      if (pc == '*') {
        star = p++;
        star_s = s;
        continue;
      }
      if (pc == '?') {
        s += rune_length(str, s);
        ++p;
        continue;
      }
      size_t width = 1;
      if (pc == '\\' && p + 1 < pattern.size()) {
        pc = pattern[p + 1];
        width = 2;
      }
      if (str[s] == pc) {
        ++s;
        p += width;
        continue;
      }
    }
    if (star == std::string_view::npos || ++backtracks > kMaxBacktracks) {
      return false;
    }
    p = star + 1;
    star_s += rune_length(str, star_s);
    s = star_s;
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

}  // namespace detail
}  // namespace rawpath
