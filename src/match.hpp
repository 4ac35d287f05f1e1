#pragma once

#include <string_view>

namespace rawpath {
namespace detail {

// Glob match: '*' is any run, '?' one character, '\' escapes. Gives up (no
// match) once the pattern needs more than a fixed number of backtracks.
bool match_pattern(std::string_view str, std::string_view pattern);

}  // namespace detail
}  // namespace rawpath
