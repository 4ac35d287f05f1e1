#pragma once

#include <string>
#include <string_view>

namespace rawpath {

struct PrettyOptions {
  std::string indent = "  ";
  std::string prefix;
  // Arrays whose single-line form fits in this many columns stay on one line.
  int width = 80;
  bool sort_keys = false;
};

std::string pretty(std::string_view json, const PrettyOptions& options = PrettyOptions{});

std::string minify(std::string_view json);

}  // namespace rawpath
